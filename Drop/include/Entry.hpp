#include "App.hpp"
#ifdef DROP_ENTRY

#include "Environment.hpp"
#include "Filesystem.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace Drop;

int main(int argc, char **argv) {
  const std::span args(argv, static_cast<usize>(argc));
  std::vector<std::string_view> views{};
  for (const auto &arg : args.subspan(1)) {
    views.emplace_back(arg);
  }

  bool headless = false;
  std::vector<std::string> launch_paths{};
  std::vector<std::string> service_texts{};
  for (auto it = views.begin(); it != views.end(); ++it) {
    if (*it == "--headless") {
      headless = true;
    } else if (*it == "--wd" && std::next(it) != views.end()) {
      std::filesystem::current_path(*++it);
    } else if (*it == "--text" && std::next(it) != views.end()) {
      service_texts.emplace_back(*++it);
    } else {
      launch_paths.emplace_back(FS::resolve(*it).string());
    }
  }

  std::array<std::string, 3> keys{"DROP_LOG_LEVEL", "DROP_TEMP_DIRECTORY",
                                  "DROP_CONTAINER_ROOT"};
  Environment::initialize(keys);

  ApplicationProperties props{
      .headless = headless,
      .launch_paths = std::move(launch_paths),
      .service_texts = std::move(service_texts),
      .max_frames = headless ? 3U : 0U,
  };

  int exit_code = 0;
  try {
    auto application = make_application(props);
    application->run();
  } catch (const std::exception &exc) {
    error("Fatal: {}", exc.what());
    exit_code = 1;
  }

  info("Exiting");
  Logger::stop();
  return exit_code;
}

#else
#error You need to define 'DROP_ENTRY' before including this file.
#endif
