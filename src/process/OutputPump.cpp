#include "process/OutputPump.hpp"
#include "log/Registry.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

using namespace bk::process;
using namespace bk::log;

OutputPump::OutputPump(const int outFd, const int errFd, LineHandler onLine, std::function<void()> onClosed)
    : AsyncService("OutputPump"), outFd_(outFd), errFd_(errFd),
      onLine_(std::move(onLine)), onClosed_(std::move(onClosed)) {}

OutputPump::~OutputPump() {
    stop();
    if (outFd_ >= 0) ::close(outFd_);
    if (errFd_ >= 0) ::close(errFd_);
}

void OutputPump::runLoop() {
    std::array<char, 4096> chunk{};

    while (!interruptFlag_.load() && (outFd_ >= 0 || errFd_ >= 0)) {
        std::array<pollfd, 2> fds{};
        nfds_t n = 0;
        if (outFd_ >= 0) fds[n++] = {outFd_, POLLIN, 0};
        if (errFd_ >= 0) fds[n++] = {errFd_, POLLIN, 0};

        const int rc = ::poll(fds.data(), n, 200);
        if (rc < 0) {
            if (errno == EINTR) continue;
            Registry::backend()->error("[OutputPump] poll failed: {}", std::strerror(errno));
            break;
        }
        if (rc == 0) continue;

        for (nfds_t i = 0; i < n; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            const bool isOut = fds[i].fd == outFd_;
            auto& fd = isOut ? outFd_ : errFd_;
            auto& buf = isOut ? outBuf_ : errBuf_;
            const auto stream = isOut ? OutputStream::Stdout : OutputStream::Stderr;

            const ssize_t r = ::read(fd, chunk.data(), chunk.size());
            if (r > 0) {
                buf.append(chunk.data(), static_cast<size_t>(r));
                emitLines(stream, buf, false);
            } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
                emitLines(stream, buf, true);
                ::close(fd);
                fd = -1;
            }
        }
    }

    if (outFd_ < 0 && errFd_ < 0 && onClosed_) onClosed_();
}

void OutputPump::emitLines(const OutputStream stream, std::string& buf, const bool flush) const {
    size_t start = 0;
    for (auto nl = buf.find('\n'); nl != std::string::npos; nl = buf.find('\n', start)) {
        if (onLine_) onLine_(stream, buf.substr(start, nl - start));
        start = nl + 1;
    }
    buf.erase(0, start);

    if (flush && !buf.empty()) {
        if (onLine_) onLine_(stream, buf);
        buf.clear();
    }
}
