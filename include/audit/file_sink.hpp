#pragma once

#include "audit/audit_sink.hpp"

#include <chrono>
#include <cstddef>
#include <fstream>
#include <string>

namespace rlsengine {

/**
 * @brief JSONL access-log file with size and age based rotation
 *
 * Rotated files get numeric suffixes (access.jsonl.1 is the newest);
 * anything beyond max_files is removed.
 *
 * @throws std::runtime_error from the constructor if the file cannot be opened
 */
class FileSink : public IAuditSink {
public:
    struct Config {
        std::string output_file = "rls_access.jsonl";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;
        int max_files = 10;
        std::chrono::hours rotation_interval{24};
        bool time_based_rotation = true;
        bool size_based_rotation = true;
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view json_lines) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t rotation_count() const { return rotation_count_; }
    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }

private:
    [[nodiscard]] bool rotation_due() const;
    void rotate();
    std::string rotated_name(int index) const;

    Config config_;
    std::ofstream out_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
    std::chrono::system_clock::time_point opened_at_;
};

} // namespace rlsengine
