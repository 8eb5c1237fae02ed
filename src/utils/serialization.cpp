#include "utils/serialization.hpp"
#include <algorithm>
#include <array>
#include <cstring>
#include <stdexcept>

namespace ActivePref {
namespace Utils {

namespace {

std::array<uint32_t, 256> make_crc_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
        }
        table[i] = c;
    }
    return table;
}

const std::array<uint32_t, 256>& crc_table() {
    static const std::array<uint32_t, 256> table = make_crc_table();
    return table;
}

void check_stream(std::ios& stream, const char* what) {
    if (!stream) {
        throw std::runtime_error(std::string("Serialization failure: ") + what);
    }
}

// Guard against absurd lengths from corrupt files
constexpr uint32_t MAX_ELEMENTS = 1u << 26;

} // namespace

void Serialization::write_u32(std::ofstream& out, uint32_t value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
    check_stream(out, "write u32");
}

uint32_t Serialization::read_u32(std::ifstream& in) {
    uint32_t value = 0;
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    check_stream(in, "unexpected end of file reading u32");
    return value;
}

void Serialization::write_vector(std::ofstream& out, const std::vector<double>& vec) {
    write_u32(out, static_cast<uint32_t>(vec.size()));
    out.write(reinterpret_cast<const char*>(vec.data()),
              static_cast<std::streamsize>(vec.size() * sizeof(double)));
    check_stream(out, "write vector");
}

std::vector<double> Serialization::read_vector(std::ifstream& in, uint32_t expected_size) {
    uint32_t size = read_u32(in);
    if (size > MAX_ELEMENTS) {
        throw std::runtime_error("Serialized vector too large: " + std::to_string(size));
    }
    if (expected_size != 0 && size != expected_size) {
        throw std::runtime_error("Serialized vector has size " + std::to_string(size) +
                                 ", expected " + std::to_string(expected_size));
    }
    std::vector<double> vec(size);
    in.read(reinterpret_cast<char*>(vec.data()),
            static_cast<std::streamsize>(size * sizeof(double)));
    check_stream(in, "unexpected end of file reading vector");
    return vec;
}

void Serialization::write_string(std::ofstream& out, const std::string& str) {
    write_u32(out, static_cast<uint32_t>(str.size()));
    out.write(str.data(), static_cast<std::streamsize>(str.size()));
    check_stream(out, "write string");
}

std::string Serialization::read_string(std::ifstream& in) {
    uint32_t size = read_u32(in);
    if (size > MAX_ELEMENTS) {
        throw std::runtime_error("Serialized string too large: " + std::to_string(size));
    }
    std::string str(size, '\0');
    in.read(&str[0], static_cast<std::streamsize>(size));
    check_stream(in, "unexpected end of file reading string");
    return str;
}

void Serialization::write_header(std::ofstream& out, uint32_t version) {
    out.write(MAGIC, static_cast<std::streamsize>(std::strlen(MAGIC)));
    write_u32(out, version);
}

uint32_t Serialization::read_header(std::ifstream& in) {
    const size_t magic_len = std::strlen(MAGIC);
    std::string magic(magic_len, '\0');
    in.read(&magic[0], static_cast<std::streamsize>(magic_len));
    if (!in || magic != MAGIC) {
        throw std::runtime_error("Invalid file header: not an ActivePref cache");
    }
    uint32_t version = read_u32(in);
    if (version == 0 || version > VERSION) {
        throw std::runtime_error("Unsupported cache version: " + std::to_string(version));
    }
    return version;
}

uint32_t Serialization::update_crc(uint32_t crc, const uint8_t* data, size_t len) {
    const auto& table = crc_table();
    for (size_t i = 0; i < len; ++i) {
        crc = table[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
    }
    return crc;
}

uint32_t Serialization::compute_checksum(const std::string& filepath, size_t num_bytes) {
    std::ifstream in(filepath, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open file for checksum: " + filepath);
    }

    uint32_t crc = 0xFFFFFFFFu;
    std::vector<char> buffer(1 << 16);
    size_t remaining = num_bytes == 0 ? get_file_size(filepath) : num_bytes;
    while (remaining > 0) {
        size_t chunk = std::min(remaining, buffer.size());
        in.read(buffer.data(), static_cast<std::streamsize>(chunk));
        size_t got = static_cast<size_t>(in.gcount());
        if (got == 0) {
            break;
        }
        crc = update_crc(crc, reinterpret_cast<const uint8_t*>(buffer.data()), got);
        remaining -= got;
    }
    return crc ^ 0xFFFFFFFFu;
}

void Serialization::append_checksum(const std::string& filepath) {
    uint32_t crc = compute_checksum(filepath);
    std::ofstream out(filepath, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot append checksum to: " + filepath);
    }
    write_u32(out, crc);
}

bool Serialization::validate_checksum(const std::string& filepath) {
    size_t size = get_file_size(filepath);
    if (size < sizeof(uint32_t)) {
        return false;
    }
    size_t payload = size - sizeof(uint32_t);
    if (payload == 0) {
        return false;
    }
    uint32_t expected = compute_checksum(filepath, payload);

    std::ifstream in(filepath, std::ios::binary);
    in.seekg(static_cast<std::streamoff>(payload));
    uint32_t stored = 0;
    in.read(reinterpret_cast<char*>(&stored), sizeof(stored));
    return in && stored == expected;
}

size_t Serialization::get_file_size(const std::string& filepath) {
    std::ifstream in(filepath, std::ios::binary | std::ios::ate);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return static_cast<size_t>(in.tellg());
}

} // namespace Utils
} // namespace ActivePref
