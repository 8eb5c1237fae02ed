#pragma once

#include <fstream>
#include <string>
#include <cstdint>
#include <vector>

namespace ActivePref {
namespace Utils {

/**
 * Binary I/O helpers for the trajectory database cache
 * All integers are written little-endian as stored in memory on x86/ARM
 */
class Serialization {
public:
    // Magic number for ActivePref cache files
    static constexpr const char* MAGIC = "APREF";
    static constexpr uint32_t VERSION = 1;

    /**
     * Write a vector of doubles to binary stream
     * Format: [size: uint32_t][data: double array]
     */
    static void write_vector(std::ofstream& out, const std::vector<double>& vec);

    /**
     * Read a vector of doubles from binary stream
     * @param expected_size Reject vectors of any other size (0 = accept any)
     */
    static std::vector<double> read_vector(std::ifstream& in, uint32_t expected_size = 0);

    /**
     * Write a length-prefixed string
     * Format: [size: uint32_t][bytes]
     */
    static void write_string(std::ofstream& out, const std::string& str);
    static std::string read_string(std::ifstream& in);

    static void write_u32(std::ofstream& out, uint32_t value);
    static uint32_t read_u32(std::ifstream& in);

    /**
     * Write file header with magic number and version
     */
    static void write_header(std::ofstream& out, uint32_t version = VERSION);

    /**
     * Read and validate file header
     * @return version number if valid, throws exception if invalid
     */
    static uint32_t read_header(std::ifstream& in);

    /**
     * Compute CRC32 checksum of file
     * @param filepath Path to file
     * @param num_bytes Number of bytes to checksum (0 = entire file)
     * @return CRC32 checksum value
     */
    static uint32_t compute_checksum(const std::string& filepath, size_t num_bytes = 0);

    /**
     * Append the checksum of everything written so far to a closed file
     */
    static void append_checksum(const std::string& filepath);

    /**
     * Verify that the trailing 4 bytes match the CRC32 of the rest of the file
     * @return true if checksum matches
     */
    static bool validate_checksum(const std::string& filepath);

    /**
     * Helper to get file size
     */
    static size_t get_file_size(const std::string& filepath);

private:
    static uint32_t update_crc(uint32_t crc, const uint8_t* data, size_t len);
};

} // namespace Utils
} // namespace ActivePref
