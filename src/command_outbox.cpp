#include "command_outbox.hpp"

#include <algorithm>
#include <iostream>

#include "core/value_utils.hpp"

namespace handlers {

CommandOutbox::CommandOutbox(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

uint64_t CommandOutbox::push(const std::string &kind, const std::string &target,
                             const YAML::Node &data) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.size() >= capacity_) {
    if (dropped_ == 0) {
      std::cerr << "[Outbox] WARNING: queue full (" << capacity_
                << "), dropping oldest commands" << std::endl;
    }
    queue_.pop_front();
    ++dropped_;
  }

  OutboxCommand command;
  command.sequence = next_sequence_++;
  command.kind = kind;
  command.target = target;
  command.data = auto_core::clone_node(data);
  queue_.push_back(std::move(command));
  return queue_.back().sequence;
}

std::vector<OutboxCommand> CommandOutbox::drain(std::size_t max_commands) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t count = max_commands == 0
                                ? queue_.size()
                                : std::min(max_commands, queue_.size());
  std::vector<OutboxCommand> out;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(std::move(queue_.front()));
    queue_.pop_front();
  }
  return out;
}

std::size_t CommandOutbox::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

uint64_t CommandOutbox::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

namespace {

YAML::Node queued(uint64_t sequence) {
  YAML::Node out;
  out["queued"] = true;
  out["sequence"] = sequence;
  return out;
}

class OutboxSceneExecutor : public auto_core::SceneExecutor {
public:
  explicit OutboxSceneExecutor(std::shared_ptr<CommandOutbox> outbox)
      : outbox_(std::move(outbox)) {}

  void activate_scene(const std::string &scene_id) override {
    outbox_->push("scene_activate", scene_id, YAML::Node(YAML::NodeType::Map));
  }

  void deactivate_scene(const std::string &scene_id) override {
    outbox_->push("scene_deactivate", scene_id,
                  YAML::Node(YAML::NodeType::Map));
  }

private:
  std::shared_ptr<CommandOutbox> outbox_;
};

} // namespace

std::shared_ptr<auto_core::Capabilities>
make_outbox_capabilities(std::shared_ptr<CommandOutbox> outbox) {
  auto caps = std::make_shared<auto_core::Capabilities>();

  caps->service_caller = [outbox](const std::string &service,
                                  const YAML::Node &data) {
    return queued(outbox->push("service", service, data));
  };

  caps->script_executor =
      [outbox](const std::string &script_id,
               const std::map<std::string, YAML::Node> &variables) {
        return queued(
            outbox->push("script", script_id, auto_core::map_to_node(variables)));
      };

  caps->notifier = [outbox](const std::string &message,
                            const std::optional<std::string> &title,
                            const std::optional<std::string> &target) {
    YAML::Node data;
    data["message"] = message;
    if (title) {
      data["title"] = *title;
    }
    outbox->push("notify", target.value_or(""), data);
  };

  caps->scene_executor = std::make_shared<OutboxSceneExecutor>(outbox);
  caps->logger = auto_core::stderr_log_sink();
  return caps;
}

} // namespace handlers
