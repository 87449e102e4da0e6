#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "companion/bitmap-stream.hpp"
#include "companion/delay-scheduler.hpp"
#include "companion/error.hpp"
#include "companion/future.hpp"
#include "companion/rpc-protocol.hpp"
#include "companion/stream-attributes.hpp"
#include "companion/target.hpp"
#include "companion/temporary-directory.hpp"

namespace companion {

// Translates control commands into calls on the target. Failures are always reported through the returned futures.
class CommandExecutor {
 public:
  // Throws std::invalid_argument if 'target' or 'temporaryDirectory' is null.
  CommandExecutor(std::shared_ptr<Target> target, std::shared_ptr<TemporaryDirectory> temporaryDirectory,
                  DelayScheduler& scheduler, std::size_t maxDecompressedBytes);

  // Runs a non streaming command and resolves with the fields of its Ok response.
  // InvalidArgument for unknown codes, malformed fields and streaming commands.
  Future<std::vector<std::string>> execute(const RpcFrame& request);

  // Target description JSON.
  Future<std::string> describe();

  Future<std::vector<std::string>> listPath(std::string path);

  // Content of the target file 'path', in 'encoding'.
  Future<std::string> pull(std::string path, std::string_view encoding);

  // Creates 'fileName' in the target directory 'destinationDirectory' from 'content', given in 'encoding'.
  Future<Void> push(std::string destinationDirectory, std::string_view fileName, std::string_view content,
                    std::string_view encoding);

  Future<Void> remove(std::vector<std::string> paths);

  Future<Void> move(std::vector<std::string> sources, std::string destinationDirectory);

  Future<Void> makeDirectory(std::string path);

  Future<StreamAttributes> streamAttributes();

  // New, idle, stream of the target screen.
  std::expected<std::shared_ptr<BitmapStream>, Error> createVideoStream();

  [[nodiscard]] const Target& target() const noexcept { return *_target; }

 private:
  std::shared_ptr<Target> _target;
  std::shared_ptr<TemporaryDirectory> _temporaryDirectory;
  DelayScheduler& _scheduler;
  std::size_t _maxDecompressedBytes;
};

}  // namespace companion
