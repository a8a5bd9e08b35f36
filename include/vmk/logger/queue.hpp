#pragma once

#include "vmk/logger/appender.hpp"

#include "vmk/std/spinlock.hpp"
#include "vmk/util/absl.hpp"
#include "vmk/util/format.hpp"

#include <atomic>
#include <memory>

namespace vmk {
    class LogQueue {
        using AppenderList = sm::InlinedVector<ILogAppender*, 4>;

        static LogQueue sLogQueue;

        stdx::SpinLock mLock;
        AppenderList mAppenders;

        /// @brief Messages submitted while @a mLock was contended.
        stdx::SpinLock mBacklogLock;
        std::unique_ptr<detail::LogMessage[]> mBacklog;
        uint32_t mCapacity = 0;
        uint32_t mHead = 0;
        uint32_t mCount = 0;

        /// @brief Number of messages that were dropped due to the backlog being full.
        std::atomic<uint32_t> mDroppedCount{0};

        /// @brief Number of messages that were written out to the appenders.
        std::atomic<uint32_t> mComittedCount{0};

        void write(const LogMessageView& message);
        size_t writeAllMessages();
        bool tryPop(detail::LogMessage *message);

    public:
        OsStatus addAppender(ILogAppender *appender) noexcept;
        void removeAppender(ILogAppender *appender) noexcept;

        OsStatus recordMessage(const detail::LogMessage& message) noexcept;
        OsStatus submit(const detail::LogMessage& message) noexcept;

        size_t flush();

        uint32_t getDroppedCount(std::memory_order order = std::memory_order_seq_cst) const noexcept {
            return mDroppedCount.load(order);
        }

        uint32_t getCommittedCount(std::memory_order order = std::memory_order_seq_cst) const noexcept {
            return mComittedCount.load(order);
        }

        static OsStatus create(uint32_t backlogCapacity, LogQueue *queue) noexcept;

        static void initGlobalLogQueue(uint32_t backlogCapacity);

        static LogQueue &getGlobalQueue() noexcept {
            return sLogQueue;
        }

        static OsStatus addGlobalAppender(ILogAppender *appender) {
            return getGlobalQueue().addAppender(appender);
        }

        static void removeGlobalAppender(ILogAppender *appender) noexcept {
            getGlobalQueue().removeAppender(appender);
        }
    };
}
