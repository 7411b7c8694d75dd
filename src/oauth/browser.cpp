#include "oauth/browser.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <vector>

namespace mcp_remote::oauth {

namespace {

struct Launcher {
  const char* name;
  bool detach;  // Browser binaries stay in the foreground
};

#if !defined(__APPLE__) && !defined(_WIN32)
const std::vector<Launcher>& linux_launchers() {
  static const std::vector<Launcher> launchers = {
      {"xdg-open", false}, {"gnome-open", false}, {"kde-open", false}, {"firefox", true}, {"chromium", true}, {"chrome", true},
  };
  return launchers;
}
#endif

}  // namespace

std::string shell_quote(const std::string& arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

void print_authorization_url(std::ostream& out, const std::string& url) {
  out << "\nPlease open the following URL in your browser to authorize the application:\n"
      << "   " << url << "\n"
      << "   After authorization, return to this application.\n\n";
  out.flush();
}

int SystemBrowserLauncher::run_command(const std::string& command) {
  return std::system(command.c_str());
}

Status SystemBrowserLauncher::try_launch(const std::string& url) {
#ifdef __APPLE__
  if (run_command("open " + shell_quote(url) + " >/dev/null 2>&1") == 0) {
    used_launcher_ = "open";
    return Status::success();
  }
  return Status::failure(ErrorKind::BrowserLaunch, "macOS browser launch failed");
#elif defined(_WIN32)
  // start treats the first quoted argument as a window title
  if (run_command("cmd /c start \"\" \"" + url + "\" >NUL 2>&1") == 0) {
    used_launcher_ = "cmd";
    return Status::success();
  }
  return Status::failure(ErrorKind::BrowserLaunch, "Windows browser launch failed");
#else
  for (const auto& launcher : linux_launchers()) {
    std::string name = launcher.name;
    if (run_command("command -v " + name + " >/dev/null 2>&1") != 0) {
      spdlog::debug("[Browser] {} not found", name);
      continue;
    }

    std::string cmd = name + " " + shell_quote(url) + " >/dev/null 2>&1";
    if (launcher.detach) {
      cmd += " &";
    }
    if (run_command(cmd) == 0) {
      spdlog::debug("[Browser] Launched with {}", name);
      used_launcher_ = name;
      return Status::success();
    }
    spdlog::debug("[Browser] {} failed", name);
  }
  return Status::failure(ErrorKind::BrowserLaunch, "No suitable browser launcher found on this system");
#endif
}

Status SystemBrowserLauncher::launch(const std::string& url) {
  spdlog::info("[Browser] Opening authorization URL");

  auto status = try_launch(url);
  if (status.failed()) {
    spdlog::warn("[Browser] {}", status.error->to_string());
    print_authorization_url(std::cerr, url);
  }
  return Status::success();
}

std::string SystemBrowserLauncher::launcher_name() const {
  if (!used_launcher_.empty()) {
    return used_launcher_;
  }
#ifdef __APPLE__
  return "open";
#elif defined(_WIN32)
  return "cmd";
#else
  return "xdg-open";
#endif
}

}  // namespace mcp_remote::oauth
