#pragma once

#include <ostream>
#include <string>

#include "core/types.hpp"

namespace mcp_remote::oauth {

// Opens the authorization URL for the user
class BrowserLauncher {
 public:
  virtual ~BrowserLauncher() = default;

  virtual Status launch(const std::string& url) = 0;

  virtual std::string launcher_name() const = 0;
};

// open (macOS), cmd /c start (Windows), or the first working of xdg-open,
// gnome-open, kde-open, firefox, chromium, chrome. When none works the URL is
// printed to stderr and launch() still succeeds; stdout is left alone since
// it carries the STDIO proxy stream.
class SystemBrowserLauncher : public BrowserLauncher {
 public:
  Status launch(const std::string& url) override;

  std::string launcher_name() const override;

  // Launch without the console fallback. BrowserLaunch error when nothing works.
  Status try_launch(const std::string& url);

 protected:
  // Run a shell command, returning its exit status
  virtual int run_command(const std::string& command);

 private:
  std::string used_launcher_;
};

// Console instructions used when no browser can be opened
void print_authorization_url(std::ostream& out, const std::string& url);

// Quote an argument for /bin/sh
std::string shell_quote(const std::string& arg);

}  // namespace mcp_remote::oauth
