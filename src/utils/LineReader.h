#pragma once
#include <string>
#include <vector>
#include <cstddef>

/**
 * @brief Buffered line splitter over a pipe descriptor.
 *
 * Bytes past the returned line stay buffered for the next call, so a stream
 * shared by consecutive commands keeps its framing. Lines longer than
 * maxLineSize come back cut (status TooLong) and the rest of that line is
 * dropped. With a non-zero tailSize the last tailSize bytes of such a line
 * follow as a regular Line once its end is reached, so a trailer written at
 * the end of an overlong line (a completion marker) is still seen.
 */
class LineReader {
public:
    enum class Status {
        Line,
        TooLong,
        Eof,
        Woken,
        Error
    };

    LineReader(int fd, size_t maxLineSize, size_t tailSize = 0);

    // Blocks until a line is available, the descriptor hits EOF, or one of
    // wakeFds becomes readable. A final unterminated line is returned before Eof.
    Status readLine(std::string& line, const std::vector<int>& wakeFds = {});

    int lastError() const { return lastErrno; }

private:
    int fd;
    size_t maxLineSize;
    size_t tailSize;
    std::string buffer;
    std::string tail;
    bool discarding = false;
    bool eof = false;
    int lastErrno = 0;

    bool takeLine(std::string& line);
    void keepTail(const std::string& data, size_t count);
    bool takeTail(std::string& line);
};
