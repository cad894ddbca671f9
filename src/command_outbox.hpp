#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "core/context.hpp"

namespace handlers {

struct OutboxCommand {
  uint64_t sequence = 0;
  std::string kind;
  std::string target;
  YAML::Node data;
};

/**
 * @brief FIFO of capability calls waiting for the host.
 *
 * The daemon answers requests over a single pipe and cannot call out, so its
 * capabilities record what they would have invoked here; the host drains
 * the queue with PollCommands. When full, the oldest command is dropped.
 *
 * Thread Safety:
 *   push() is called from run threads, drain() from the protocol loop.
 */
class CommandOutbox {
public:
  explicit CommandOutbox(std::size_t capacity = 10000);

  // Returns the command's sequence number
  uint64_t push(const std::string &kind, const std::string &target,
                const YAML::Node &data);

  // Oldest first; max_commands = 0 drains everything
  std::vector<OutboxCommand> drain(std::size_t max_commands = 0);

  std::size_t size() const;
  uint64_t dropped() const;

private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<OutboxCommand> queue_;
  uint64_t next_sequence_ = 1;
  uint64_t dropped_ = 0;
};

// Capabilities whose service/script/notify/scene calls are queued in
// `outbox` and reported as {queued: true, sequence: n}. Logging goes to
// stderr.
std::shared_ptr<auto_core::Capabilities>
make_outbox_capabilities(std::shared_ptr<CommandOutbox> outbox);

} // namespace handlers
