#pragma once

#include <cstdint>
#include <limits>

#include "errors.hpp"

namespace asrstream {

// 请求序号：从1开始递增，结束时给出唯一的负数终止序号
class SequenceCounter {
public:
    int32_t next() {
        if (finalized_) {
            throw AsrError(ErrorCode::INVALID_STATE, "Sequence counter already finalized");
        }
        if (next_ == std::numeric_limits<int32_t>::max()) {
            throw AsrError(ErrorCode::INVALID_STATE, "Sequence counter exhausted");
        }
        return next_++;
    }

    // 终止序号为下一个序号取负
    int32_t finalize() {
        if (finalized_) {
            throw AsrError(ErrorCode::INVALID_STATE, "Sequence counter already finalized");
        }
        finalized_ = true;
        return -next_;
    }

    int32_t peek() const { return next_; }
    bool finalized() const { return finalized_; }

private:
    int32_t next_{1};
    bool finalized_{false};
};

} // namespace asrstream
