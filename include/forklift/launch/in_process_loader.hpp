#pragma once

#include <memory>
#include <utility>

#include <spdlog/logger.h>

#include "forklift/launch/launch_spec.hpp"

namespace forklift::launch {

// Runs a unit's entry point on the calling thread.
//
// Settings that only mean something for a child process (runtime
// arguments, working directory, properties, max memory, runtime
// executable) are ignored, with one warning each.
class InProcessLoader {
 public:
  explicit InProcessLoader(std::shared_ptr<spdlog::logger> logger)
      : logger_(std::move(logger)) {
  }

  // Throws:
  //   ConfigurationError   no entry point name, or an archive is set
  //   LoadError            unit not found, or it has no entry point
  //   TargetExecutionError the entry point threw; Cause() is what it threw
  void Invoke(const LaunchSpec& spec) const;

 private:
  void WarnIgnoredSettings(const LaunchSpec& spec) const;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace forklift::launch
