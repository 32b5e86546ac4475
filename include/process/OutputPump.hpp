#pragma once

#include "concurrency/AsyncService.hpp"
#include "process/ChildProcess.hpp"

#include <functional>
#include <string>

namespace bk::process {

// Splits the child's stdout/stderr pipes into lines and hands them to a LineHandler.
// Owns both read ends.
class OutputPump final : public concurrency::AsyncService {
public:
    OutputPump(int outFd, int errFd, LineHandler onLine, std::function<void()> onClosed);
    ~OutputPump() override;

protected:
    void runLoop() override;

private:
    int outFd_;
    int errFd_;
    LineHandler onLine_;
    std::function<void()> onClosed_;
    std::string outBuf_, errBuf_;

    void emitLines(OutputStream stream, std::string& buf, bool flush) const;
};

}
