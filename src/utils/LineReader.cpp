#include "utils/LineReader.h"
#include <cerrno>
#include <unistd.h>
#include <poll.h>

LineReader::LineReader(int fd, size_t maxLineSize, size_t tailSize)
    : fd(fd), maxLineSize(maxLineSize), tailSize(tailSize) {}

void LineReader::keepTail(const std::string& data, size_t count) {
    if (tailSize == 0) return;
    if (count >= tailSize) {
        tail.assign(data, count - tailSize, tailSize);
        return;
    }
    tail.append(data, 0, count);
    if (tail.size() > tailSize) tail.erase(0, tail.size() - tailSize);
}

bool LineReader::takeTail(std::string& line) {
    if (tailSize == 0) return false;
    line.swap(tail);
    tail.clear();
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

bool LineReader::takeLine(std::string& line) {
    auto newline = buffer.find('\n');
    if (newline == std::string::npos) return false;
    line.assign(buffer, 0, newline);
    buffer.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

LineReader::Status LineReader::readLine(std::string& line, const std::vector<int>& wakeFds) {
    char temp[4096];
    while (true) {
        if (discarding) {
            auto newline = buffer.find('\n');
            if (newline == std::string::npos) {
                keepTail(buffer, buffer.size());
                buffer.clear();
            } else {
                keepTail(buffer, newline);
                buffer.erase(0, newline + 1);
                discarding = false;
                if (takeTail(line)) return Status::Line;
            }
        }
        if (!discarding) {
            auto newline = buffer.find('\n');
            bool overlong = newline != std::string::npos ? newline > maxLineSize : buffer.size() >= maxLineSize;
            if (overlong) {
                line.assign(buffer, 0, maxLineSize);
                buffer.erase(0, maxLineSize);
                tail.clear();
                keepTail(line, line.size());
                discarding = true;
                return Status::TooLong;
            }
            if (takeLine(line)) return Status::Line;
            if (eof) {
                if (buffer.empty()) return Status::Eof;
                line.swap(buffer);
                buffer.clear();
                return Status::Line;
            }
        } else if (eof) {
            discarding = false;
            if (takeTail(line)) return Status::Line;
            return Status::Eof;
        }

        std::vector<pollfd> pfds;
        pfds.push_back({fd, POLLIN, 0});
        for (int wake : wakeFds) {
            pfds.push_back({wake, POLLIN, 0});
        }
        int ready = poll(pfds.data(), pfds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            lastErrno = errno;
            return Status::Error;
        }
        for (size_t i = 1; i < pfds.size(); ++i) {
            if (pfds[i].revents != 0) return Status::Woken;
        }
        if (pfds[0].revents & POLLNVAL) {
            lastErrno = EBADF;
            return Status::Error;
        }
        if (pfds[0].revents == 0) continue;

        ssize_t n = read(fd, temp, sizeof(temp));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            lastErrno = errno;
            return Status::Error;
        }
        if (n == 0) {
            eof = true;
            continue;
        }
        buffer.append(temp, static_cast<size_t>(n));
    }
}
