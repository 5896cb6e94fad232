#include "executor/poller.hpp"

#include <thread>

#include "glog/logging.h"

namespace executor {

size_t Poller::PollOnce() {
  proto::StoreResponse response;
  try {
    response = store_->ListFiles(proto::COMMAND);
  } catch (const store::transport_error& e) {
    LOG(ERROR) << "Server unreachable: " << e.what();
    return 0;
  }
  if (!response.success()) {
    LOG(WARNING) << "Failed to fetch command list: " << response.error();
    return 0;
  }
  if (response.files_size() > 0) {
    LOG(INFO) << "Found " << response.files_size() << " new task(s)";
  }
  for (const std::string& id : response.files()) {
    try {
      dispatcher_->Process(id);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Critical failure while processing " << id << ": "
                 << e.what();
    }
  }
  return response.files_size();
}

void Poller::Run() {
  while (!stopped_) {
    PollOnce();
    if (stopped_) break;
    std::this_thread::sleep_for(interval_);
  }
}

}  // namespace executor
