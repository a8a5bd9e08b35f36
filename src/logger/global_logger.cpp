#include "vmk/logger/queue.hpp"
#include "vmk/panic.hpp"

vmk::LogQueue vmk::LogQueue::sLogQueue{};

void vmk::LogQueue::initGlobalLogQueue(uint32_t backlogCapacity) {
    OsStatus status = LogQueue::create(backlogCapacity, &sLogQueue);
    VMK_CHECK(status == OsStatusSuccess, "Failed to create global log queue");
}
