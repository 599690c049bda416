#include "audit/file_sink.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace rlsengine {

FileSink::FileSink(const Config& config)
    : config_(config),
      opened_at_(std::chrono::system_clock::now()) {
    out_.open(config_.output_file, std::ios::app);
    if (!out_.is_open()) {
        throw std::runtime_error("Failed to open access log: " + config_.output_file);
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(config_.output_file, ec);
    if (!ec) {
        current_file_size_ = static_cast<size_t>(size);
    }
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::write(std::string_view json_lines) {
    if (rotation_due()) {
        rotate();
    }
    out_.write(json_lines.data(), static_cast<std::streamsize>(json_lines.size()));
    current_file_size_ += json_lines.size();
    return out_.good();
}

void FileSink::flush() {
    out_.flush();
}

void FileSink::shutdown() {
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

std::string FileSink::name() const {
    return "file:" + config_.output_file;
}

bool FileSink::rotation_due() const {
    if (config_.size_based_rotation && current_file_size_ >= config_.max_file_size_bytes) {
        return true;
    }
    return config_.time_based_rotation &&
           std::chrono::system_clock::now() - opened_at_ >= config_.rotation_interval;
}

std::string FileSink::rotated_name(int index) const {
    return std::format("{}.{}", config_.output_file, index);
}

void FileSink::rotate() {
    out_.flush();
    out_.close();

    // Missing files are expected while the chain is still short
    std::error_code ec;
    std::filesystem::remove(rotated_name(config_.max_files), ec);
    for (int i = config_.max_files - 1; i >= 1; --i) {
        std::filesystem::rename(rotated_name(i), rotated_name(i + 1), ec);
    }
    std::filesystem::rename(config_.output_file, rotated_name(1), ec);
    if (ec) {
        utils::log::warn(std::format("Access log rotation: cannot rename {}: {}",
                                     config_.output_file, ec.message()));
    }

    out_.open(config_.output_file, std::ios::app);
    current_file_size_ = 0;
    opened_at_ = std::chrono::system_clock::now();
    ++rotation_count_;
}

} // namespace rlsengine
