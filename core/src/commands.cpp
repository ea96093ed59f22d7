#include "core/commands.h"

namespace bgt::core {

namespace {

struct NameVisitor {
  const char *operator()(const CancelCommand &) const { return "cancel"; }
  const char *operator()(const PauseCommand &) const { return "pause"; }
  const char *operator()(const ResumeCommand &) const { return "resume"; }
  const char *operator()(const StatusCommand &) const { return "get_status"; }
};

} // namespace

const char *command_name(const TaskCommand &command) {
  return std::visit(NameVisitor{}, command);
}

} // namespace bgt::core
