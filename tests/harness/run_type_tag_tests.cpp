#include "chunk/type_tag.hpp"
#include "format/errors.hpp"

#include <iostream>
#include <sstream>
#include <string>

namespace {

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static pchunk::TypeTag tag_(const char* s) {
        return pchunk::TypeTag::from_ascii(s);
    }

    // Runs from_ascii and reports the error kind, or 0 on success.
    static int from_ascii_error_(const std::string& s) {
        try {
            (void)pchunk::TypeTag::from_ascii(s);
            return 0;
        } catch (const pchunk::InvalidTag& e) {
            return static_cast<int>(e.kind());
        }
    }

    static bool test_from_bytes_round_trip_() {
        const pchunk::TypeTag::Bytes expected = {82, 117, 83, 116};
        const auto t = pchunk::TypeTag::from_bytes(expected);

        bool ok = true;
        ok &= require_(t.to_bytes() == expected, "to_bytes must return the bytes given to from_bytes");
        ok &= require_(t.to_ascii_string() == "RuSt", "bytes 82,117,83,116 must render as RuSt");
        return ok;
    }

    static bool test_from_ascii_matches_from_bytes_() {
        const auto a = pchunk::TypeTag::from_bytes({82, 117, 83, 116});
        const auto b = tag_("RuSt");

        bool ok = true;
        ok &= require_(a == b, "from_ascii(RuSt) must equal from_bytes(82,117,83,116)");
        ok &= require_(!(a != b), "operator!= must agree with operator==");
        ok &= require_(tag_("RuSt") != tag_("RUSt"), "tags differing in one byte must compare unequal");
        return ok;
    }

    static bool test_from_ascii_validation_() {
        const int wrong_len = static_cast<int>(pchunk::InvalidTagKind::WrongLength);
        const int non_alpha = static_cast<int>(pchunk::InvalidTagKind::NonAlphabetic);

        bool ok = true;
        ok &= require_(from_ascii_error_("RuSt") == 0, "RuSt must be accepted");
        ok &= require_(from_ascii_error_("zzZZ") == 0, "any four letters must be accepted");
        ok &= require_(from_ascii_error_("Ru1t") == non_alpha, "Ru1t must fail with NonAlphabetic");
        ok &= require_(from_ascii_error_("Ru t") == non_alpha, "a space must fail with NonAlphabetic");
        ok &= require_(from_ascii_error_("Rus") == wrong_len, "Rus must fail with WrongLength");
        ok &= require_(from_ascii_error_("RuStX") == wrong_len, "5 bytes must fail with WrongLength");
        ok &= require_(from_ascii_error_("") == wrong_len, "empty input must fail with WrongLength");
        ok &= require_(from_ascii_error_("R\xE9St") == non_alpha, "non-ASCII byte must fail with NonAlphabetic");
        return ok;
    }

    static bool test_critical_bit_() {
        bool ok = true;
        ok &= require_(tag_("RuSt").is_critical(), "uppercase first byte must be critical");
        ok &= require_(!tag_("ruSt").is_critical(), "lowercase first byte must be ancillary");
        return ok;
    }

    static bool test_public_bit_() {
        bool ok = true;
        ok &= require_(tag_("RUSt").is_public(), "uppercase second byte must be public");
        ok &= require_(!tag_("RuSt").is_public(), "lowercase second byte must be private");
        return ok;
    }

    static bool test_reserved_bit_() {
        bool ok = true;
        ok &= require_(tag_("RuSt").is_reserved_bit_valid(), "uppercase third byte must be reserved-valid");
        ok &= require_(!tag_("Rust").is_reserved_bit_valid(), "lowercase third byte must be reserved-invalid");
        ok &= require_(tag_("RuSt").is_valid(), "RuSt must be valid");
        ok &= require_(!tag_("Rust").is_valid(), "Rust must be invalid");
        return ok;
    }

    static bool test_safe_to_copy_bit_() {
        bool ok = true;
        ok &= require_(tag_("RuSt").is_safe_to_copy(), "lowercase fourth byte must be safe to copy");
        ok &= require_(!tag_("RuST").is_safe_to_copy(), "uppercase fourth byte must be unsafe to copy");
        return ok;
    }

    static bool test_flags_on_non_letters_() {
        // 0x20 alone sets every property bit; 0x00 clears them all.
        const auto all_set = pchunk::TypeTag::from_bytes({0x20, 0x20, 0x20, 0x20});
        const auto all_clear = pchunk::TypeTag::from_bytes({0x00, 0x00, 0x00, 0x00});

        bool ok = true;
        ok &= require_(!all_set.is_critical(), "0x20 must read as ancillary");
        ok &= require_(!all_set.is_public(), "0x20 must read as private");
        ok &= require_(!all_set.is_valid(), "0x20 must read as reserved-invalid");
        ok &= require_(all_set.is_safe_to_copy(), "0x20 must read as safe to copy");
        ok &= require_(all_clear.is_critical(), "0x00 must read as critical");
        ok &= require_(all_clear.is_public(), "0x00 must read as public");
        ok &= require_(all_clear.is_valid(), "0x00 must read as reserved-valid");
        ok &= require_(!all_clear.is_safe_to_copy(), "0x00 must read as unsafe to copy");
        return ok;
    }

    static bool test_ascii_string_is_not_revalidated_() {
        const auto t = pchunk::TypeTag::from_bytes({'a', '\n', 0x01, '9'});
        const std::string s = t.to_ascii_string();

        bool ok = true;
        ok &= require_(s.size() == 4, "unchecked tag must still render 4 characters");
        ok &= require_(s == std::string("a\n\x01" "9"), "unchecked tag must render byte-for-byte");
        return ok;
    }

    static bool test_stream_output_() {
        std::ostringstream os;
        os << tag_("IHDR");
        return require_(os.str() == "IHDR", "operator<< must write the ASCII form");
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"from_bytes_round_trip", test_from_bytes_round_trip_},
        {"from_ascii_matches_from_bytes", test_from_ascii_matches_from_bytes_},
        {"from_ascii_validation", test_from_ascii_validation_},
        {"critical_bit", test_critical_bit_},
        {"public_bit", test_public_bit_},
        {"reserved_bit", test_reserved_bit_},
        {"safe_to_copy_bit", test_safe_to_copy_bit_},
        {"flags_on_non_letters", test_flags_on_non_letters_},
        {"ascii_string_is_not_revalidated", test_ascii_string_is_not_revalidated_},
        {"stream_output", test_stream_output_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        bool passed = false;
        try {
            passed = c.fn();
        } catch (const std::exception& e) {
            std::cerr << "  - unexpected exception: " << e.what() << "\n";
        }
        if (!passed) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
