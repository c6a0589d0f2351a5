#include "cli/cli_parser.hpp"
#include "chunk/chunk.hpp"
#include "chunk/type_tag.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

static const char* kUsage =
    "Usage: chunk_encode --type <TAG> --out <output.chunk> (--in <payload file> | --text <message>)\n";

static std::vector<uint8_t> read_all(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);
    ifs.seekg(0, std::ios::end);
    std::streamsize n = ifs.tellg();
    ifs.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(n));
    ifs.read(reinterpret_cast<char*>(buf.data()), n);
    if (ifs.gcount() != n) throw std::runtime_error("Short read: " + path);
    return buf;
}

static void write_all(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
    ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!ofs.good()) throw std::runtime_error("Write failed: " + path);
}

int main(int argc, char** argv) {
    try {
        pchunk::CliParser cli;
        cli.parse(argc, argv);
        const std::string type = cli.get("type");
        const std::string out = cli.get("out");
        const bool from_file = cli.has("in");
        const bool from_text = cli.has("text");
        if (type.empty() || out.empty() || from_file == from_text) {
            std::cout << kUsage;
            return 1;
        }

        const auto tag = pchunk::TypeTag::from_ascii(type);
        std::vector<uint8_t> payload;
        if (from_file) {
            payload = read_all(cli.get("in"));
        } else {
            const std::string text = cli.get("text");
            payload.assign(text.begin(), text.end());
        }

        const pchunk::Chunk chunk(tag, std::move(payload));
        const auto bytes = chunk.to_bytes();
        write_all(out, bytes);

        std::cout << "type: " << chunk.type_tag() << "\n";
        std::cout << "length: " << chunk.length() << "\n";
        std::cout << "checksum: " << chunk.checksum() << "\n";
        std::cout << "Wrote: " << out << " (" << bytes.size() << " bytes)\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
