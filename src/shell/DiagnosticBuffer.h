#pragma once
#include <string>
#include <mutex>

// Capped stderr accumulator. A line that would push the buffer past its
// capacity is dropped whole; what is already buffered is kept.
class DiagnosticBuffer {
public:
    explicit DiagnosticBuffer(size_t capacity) : capacity(capacity) {}

    void appendLine(const std::string& line) {
        std::lock_guard<std::mutex> lock(mtx);
        if (text.size() + line.size() + 1 > capacity) return;
        text += line;
        text += '\n';
    }

    // Snapshot and reset.
    std::string consume() {
        std::lock_guard<std::mutex> lock(mtx);
        std::string out;
        out.swap(text);
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return text.size();
    }

private:
    const size_t capacity;
    mutable std::mutex mtx;
    std::string text;
};
