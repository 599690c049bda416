#pragma once

#include <string>
#include <string_view>

namespace rlsengine {

/**
 * @brief Destination for serialized access records
 *
 * Called only from the emitter's writer thread; implementations need no
 * locking of their own.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /// Write one or more newline-terminated JSON lines. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view json_lines) = 0;

    virtual void flush() = 0;

    virtual void shutdown() = 0;

    /// Sink name for logging (e.g. "file:/var/log/rls_access.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace rlsengine
