#include "share_launcher.hpp"

#include <cstdlib>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace favorites::exporter {

namespace {

std::string ShellQuote(const std::string& text) {
  std::string out = "'";
  for (char c : text) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += "'";
  return out;
}

bool ReplacePlaceholder(std::string& text, const std::string& placeholder, const std::string& value) {
  bool        replaced = false;
  std::size_t pos      = 0;
  while ((pos = text.find(placeholder, pos)) != std::string::npos) {
    text.replace(pos, placeholder.size(), value);
    pos += value.size();
    replaced = true;
  }
  return replaced;
}

} // namespace

CommandShareLauncher::CommandShareLauncher(std::string command) : command_(std::move(command)) {
  if (command_.empty()) {
    throw std::invalid_argument("share command must not be empty");
  }
}

std::string CommandShareLauncher::BuildCommand(const ExportFileRef& file) const {
  auto command  = command_;
  bool replaced = ReplacePlaceholder(command, "{path}", ShellQuote(file.path.string()));
  replaced      = ReplacePlaceholder(command, "{uri}", ShellQuote(file.Uri())) || replaced;
  if (!replaced) {
    command += " " + ShellQuote(file.path.string());
  }
  return command;
}

void CommandShareLauncher::Share(const ExportFileRef& file) {
  const auto command = BuildCommand(file);
  FAVORITES_LOG_DEBUG("Launching share command", {observability::StringField("command", command)});

  const int rc = std::system(command.c_str());
  if (rc != 0) {
    throw util::DeliveryError("share command exited with status " + std::to_string(rc));
  }
}

} // namespace favorites::exporter
