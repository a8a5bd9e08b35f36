#include "vmk/logger/logger.hpp"

#include <algorithm>

void vmk::LogQueue::write(const LogMessageView& message) {
    for (ILogAppender *appender : mAppenders) {
        appender->write(message);
    }
}

bool vmk::LogQueue::tryPop(detail::LogMessage *message) {
    stdx::LockGuard guard(mBacklogLock);
    if (mCount == 0) {
        return false;
    }

    *message = mBacklog[mHead];
    mHead = (mHead + 1) % mCapacity;
    mCount -= 1;
    return true;
}

size_t vmk::LogQueue::writeAllMessages() {
    size_t count = 0;
    detail::LogMessage message;
    while (tryPop(&message)) {
        write({ message.location, message.message, message.logger, message.level });
        count++;
    }

    mComittedCount.fetch_add(count, std::memory_order_relaxed);

    return count;
}

OsStatus vmk::LogQueue::addAppender(ILogAppender *appender) noexcept {
    stdx::LockGuard guard(mLock);
    mAppenders.push_back(appender);
    return OsStatusSuccess;
}

void vmk::LogQueue::removeAppender(ILogAppender *appender) noexcept {
    stdx::LockGuard guard(mLock);
    mAppenders.erase(std::remove(mAppenders.begin(), mAppenders.end(), appender), mAppenders.end());
}

OsStatus vmk::LogQueue::recordMessage(const detail::LogMessage& message) noexcept {
    stdx::LockGuard guard(mBacklogLock);
    if (mCount < mCapacity) {
        mBacklog[(mHead + mCount) % mCapacity] = message;
        mCount += 1;
        return OsStatusSuccess;
    }

    mDroppedCount.fetch_add(1, std::memory_order_relaxed);

    return OsStatusOutOfMemory;
}

OsStatus vmk::LogQueue::submit(const detail::LogMessage& message) noexcept {
    if (mLock.try_lock()) {
        writeAllMessages();
        write({ message.location, message.message, message.logger, message.level });
        mLock.unlock();
        return OsStatusSuccess;
    } else {
        return recordMessage(message);
    }
}

size_t vmk::LogQueue::flush() {
    stdx::LockGuard guard(mLock);
    return writeAllMessages();
}

OsStatus vmk::LogQueue::create(uint32_t backlogCapacity, LogQueue *queue) noexcept {
    detail::LogMessage *backlog = new (std::nothrow) detail::LogMessage[backlogCapacity];
    if (backlog == nullptr) {
        return OsStatusOutOfMemory;
    }

    stdx::LockGuard guard(queue->mBacklogLock);
    queue->mBacklog.reset(backlog);
    queue->mCapacity = backlogCapacity;
    queue->mHead = 0;
    queue->mCount = 0;
    return OsStatusSuccess;
}

stdx::StringView vmk::Logger::getName() const noexcept {
    return mName;
}

void vmk::Logger::submit(LogLevel level, stdx::StringView message, std::source_location location) noexcept {
    detail::LogMessage logMessage {
        .level = level,
        .location = location,
        .logger = this,
        .message = message,
    };

    mQueue->submit(logMessage);
}

void vmk::Logger::dbg(stdx::StringView message, std::source_location location) noexcept {
    submit(LogLevel::eDebug, message, location);
}

void vmk::Logger::info(stdx::StringView message, std::source_location location) noexcept {
    submit(LogLevel::eInfo, message, location);
}

void vmk::Logger::warn(stdx::StringView message, std::source_location location) noexcept {
    submit(LogLevel::eWarning, message, location);
}

void vmk::Logger::error(stdx::StringView message, std::source_location location) noexcept {
    submit(LogLevel::eError, message, location);
}

void vmk::Logger::fatal(stdx::StringView message, std::source_location location) noexcept {
    submit(LogLevel::eFatal, message, location);
}
