#include "tivar/tivar_easy.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <vector>

static void write_bytes(const std::filesystem::path& p, const std::vector<std::uint8_t>& bytes) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("cannot open " + p.string() + " for writing");
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) throw std::runtime_error("write failed: " + p.string());
}

static std::vector<std::uint8_t> read_bytes(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open " + p.string());
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

int main(int argc, char** argv) {
    try {
        using namespace tivar;

        CalculatorFile file;
        file.comment = Comment::from_text("Created by tivar_demo");

        easy::add(file, VarName::from_text("A"), easy::make_real(-314.0));
        easy::add(file, VarName::from_text("Z"), easy::make_complex(3.0, 4.0));
        easy::add(file, VarName::list(0), easy::make_real_list({1.5, 2.5, 3.5}));
        easy::add(file, VarName::matrix(0), easy::make_matrix(2, 2, {1, 0, 0, 1}));
        // :Disp "HI"
        easy::add(file, VarName::from_text("HI"), easy::make_program({0xDE, 0x2A, 0x48, 0x49, 0x2A}));

        std::filesystem::path out = (argc >= 2) ? argv[1] : "demo_out.8xg";
        write_bytes(out, encode_file(file));
        std::cout << "Wrote: " << out.string() << "\n";

        auto bytes = read_bytes(out);
        ValidationReport report = validate_file(bytes);
        for (const auto& issue : report.issues) {
            std::cout << "  " << to_string(issue.kind) << ": " << issue.message << "\n";
        }

        CalculatorFile back = decode_file(bytes);
        std::cout << "Format: " << to_string(back.format)
                  << " comment=\"" << back.comment.text() << "\""
                  << " data=" << back.data_length() << " bytes"
                  << " checksum=0x" << std::hex << back.checksum() << std::dec << "\n";

        for (const auto& e : back.entries) {
            std::cout << "  " << e.name.to_string() << ": " << tag_name(e.type_tag());
            if (e.type_tag() == static_cast<std::uint8_t>(TypeTag::Real)) {
                std::cout << " = " << e.value.as_real().to_double();
            } else if (e.type_tag() == static_cast<std::uint8_t>(TypeTag::RealList)) {
                std::cout << " of " << e.value.as_real_list().elements.size();
            } else if (e.type_tag() == static_cast<std::uint8_t>(TypeTag::Program)) {
                std::cout << ", " << e.value.as_program_bytes().size() << " token bytes";
            }
            std::cout << (e.archived() ? " (archived)" : "") << "\n";
        }

        std::cout << "OK\n";
        return 0;

    } catch (const tivar::TiVarError& e) {
        std::cerr << "tivar error (" << tivar::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
