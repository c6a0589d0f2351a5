#include "cli/cli_parser.hpp"
#include "chunk/chunk.hpp"
#include "format/errors.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <vector>

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

static const char* yes_no(bool v) { return v ? "yes" : "no"; }

int main(int argc, char** argv) {
    try {
        pchunk::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        if (in.empty()) {
            std::cerr << "Usage: chunk_decode --in <input.chunk> [--out <payload file>] [--strict]\n";
            return 1;
        }

        const auto bytes = read_all(in);
        const auto chunk = pchunk::Chunk::from_bytes(bytes);
        const auto& tag = chunk.type_tag();
        if (cli.get_flag("strict") && !tag.is_valid()) {
            throw std::runtime_error("chunk type '" + tag.to_ascii_string() + "' has the reserved bit set");
        }

        std::cout << "type: " << tag << "\n";
        std::cout << "  critical: " << yes_no(tag.is_critical()) << "\n";
        std::cout << "  public: " << yes_no(tag.is_public()) << "\n";
        std::cout << "  reserved bit valid: " << yes_no(tag.is_reserved_bit_valid()) << "\n";
        std::cout << "  safe to copy: " << yes_no(tag.is_safe_to_copy()) << "\n";
        std::cout << "length: " << chunk.length() << "\n";
        std::cout << "checksum: " << chunk.checksum()
                  << " (0x" << std::hex << std::setw(8) << std::setfill('0') << chunk.checksum()
                  << std::dec << ")\n";
        if (bytes.size() > chunk.encoded_size()) {
            std::cout << "trailing bytes: " << (bytes.size() - chunk.encoded_size()) << "\n";
        }

        try {
            std::cout << "payload: " << chunk.payload_as_text() << "\n";
        } catch (const pchunk::TextError& e) {
            std::cout << "payload: <binary, not UTF-8 at offset " << e.bad_offset() << ">\n";
        }

        if (!out.empty()) {
            write_all(out, chunk.payload());
            std::cout << "Wrote: " << out << " (" << chunk.payload().size() << " bytes)\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
