#include "tivar/tivar_easy.hpp"

#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <vector>

static double ms_since(const std::chrono::high_resolution_clock::time_point& t0) {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(high_resolution_clock::now() - t0).count();
}

// Fills the entry region close to its 16-bit limit.
static tivar::CalculatorFile make_payload(std::size_t lists, std::size_t per_list) {
    tivar::CalculatorFile f;
    f.comment = tivar::Comment::from_text("tivar bench");

    std::mt19937_64 rng(123);
    std::uniform_real_distribution<double> dist(-1000.0, 1000.0);
    for (std::size_t i = 0; i < lists; ++i) {
        std::vector<double> v(per_list);
        for (auto& x : v) x = dist(rng);
        std::string name = "L" + std::to_string(i);
        tivar::easy::add(f, tivar::VarName::user_list(name), tivar::easy::make_real_list(v));
    }
    return f;
}

static void bench_one(std::size_t rounds) {
    tivar::CalculatorFile file = make_payload(6, 1200);

    auto t0 = std::chrono::high_resolution_clock::now();
    std::vector<std::uint8_t> bytes;
    for (std::size_t i = 0; i < rounds; ++i) bytes = tivar::encode_file(file);
    double e_ms = ms_since(t0);

    double mb = static_cast<double>(bytes.size() * rounds) / (1024.0 * 1024.0);
    std::cout << "file=" << bytes.size() << " bytes, rounds=" << rounds << "\n";
    std::cout << "encode: " << e_ms << " ms, throughput=" << (mb / (e_ms / 1000.0)) << " MiB/s\n";

    t0 = std::chrono::high_resolution_clock::now();
    std::size_t entries = 0;
    for (std::size_t i = 0; i < rounds; ++i) entries += tivar::decode_file(bytes).entries.size();
    double d_ms = ms_since(t0);
    std::cout << "decode: " << d_ms << " ms, throughput=" << (mb / (d_ms / 1000.0)) << " MiB/s"
              << " (" << entries << " entries)\n";

    t0 = std::chrono::high_resolution_clock::now();
    std::size_t issues = 0;
    for (std::size_t i = 0; i < rounds; ++i) issues += tivar::validate_file(bytes).issues.size();
    double v_ms = ms_since(t0);
    std::cout << "validate: " << v_ms << " ms, throughput=" << (mb / (v_ms / 1000.0)) << " MiB/s"
              << " (" << issues << " issues)\n";
}

int main(int argc, char** argv) {
    try {
        std::size_t rounds = (argc >= 2) ? static_cast<std::size_t>(std::stoul(argv[1])) : 200;
        bench_one(rounds);
    } catch (const std::exception& e) {
        std::cerr << "bench error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
