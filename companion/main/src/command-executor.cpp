#include "companion/command-executor.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <exception>
#include <expected>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "companion/bitmap-stream.hpp"
#include "companion/error.hpp"
#include "companion/file-commands.hpp"
#include "companion/future.hpp"
#include "companion/gzip-codec.hpp"
#include "companion/host-file-paths.hpp"
#include "companion/log.hpp"
#include "companion/rpc-protocol.hpp"
#include "companion/stream-attributes.hpp"
#include "companion/target.hpp"

namespace companion {

namespace {

Error InvalidFields(const RpcFrame& request, std::string_view expected) {
  return {ErrorKind::InvalidArgument, fmt::format("{} expects {}, got {} field(s)", RpcCommandName(request.code),
                                                  expected, request.fields.size())};
}

bool IsKnownEncoding(std::string_view encoding) {
  return encoding == kIdentityEncoding || encoding == kGzipEncoding;
}

Error UnknownEncoding(std::string_view encoding) {
  return {ErrorKind::InvalidArgument, fmt::format("unknown payload encoding '{}'", encoding)};
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec) {
    log::warn("Unable to remove {}: {}", path.string(), ec.message());
  }
}

template <class T>
Future<std::vector<std::string>> NoFields(const Future<T>& future) {
  return future.map([](const T&) { return std::vector<std::string>{}; });
}

}  // namespace

CommandExecutor::CommandExecutor(std::shared_ptr<Target> target, std::shared_ptr<TemporaryDirectory> temporaryDirectory,
                                 DelayScheduler& scheduler, std::size_t maxDecompressedBytes)
    : _target(std::move(target)),
      _temporaryDirectory(std::move(temporaryDirectory)),
      _scheduler(scheduler),
      _maxDecompressedBytes(maxDecompressedBytes) {
  if (!_target) {
    throw std::invalid_argument("CommandExecutor requires a target");
  }
  if (!_temporaryDirectory) {
    throw std::invalid_argument("CommandExecutor requires a temporary directory");
  }
}

Future<std::vector<std::string>> CommandExecutor::execute(const RpcFrame& request) {
  using Fields = std::vector<std::string>;
  const auto& fields = request.fields;
  try {
    switch (static_cast<RpcCommand>(request.code)) {
      case RpcCommand::Describe:
        return describe().map([](const std::string& description) { return Fields{description}; });
      case RpcCommand::ListPath:
        if (fields.size() != 1) {
          return Future<Fields>::Failed(InvalidFields(request, "a path"));
        }
        return listPath(fields[0]);
      case RpcCommand::Pull: {
        if (fields.empty() || fields.size() > 2) {
          return Future<Fields>::Failed(InvalidFields(request, "a path and an optional encoding"));
        }
        std::string encoding(fields.size() == 2 ? std::string_view(fields[1]) : kIdentityEncoding);
        return pull(fields[0], encoding).map([encoding](const std::string& content) {
          return Fields{encoding, content};
        });
      }
      case RpcCommand::Push:
        if (fields.size() != 3 && fields.size() != 4) {
          return Future<Fields>::Failed(
              InvalidFields(request, "a destination directory, a file name, a content and an optional encoding"));
        }
        return NoFields(push(fields[0], fields[1], fields[2],
                             fields.size() == 4 ? std::string_view(fields[3]) : kIdentityEncoding));
      case RpcCommand::Remove:
        if (fields.empty()) {
          return Future<Fields>::Failed(InvalidFields(request, "at least one path"));
        }
        return NoFields(remove(fields));
      case RpcCommand::Move:
        if (fields.size() < 2) {
          return Future<Fields>::Failed(InvalidFields(request, "a destination directory and at least one source"));
        }
        return NoFields(move(Fields(fields.begin() + 1, fields.end()), fields[0]));
      case RpcCommand::MakeDirectory:
        if (fields.size() != 1) {
          return Future<Fields>::Failed(InvalidFields(request, "a path"));
        }
        return NoFields(makeDirectory(fields[0]));
      case RpcCommand::StreamAttributes:
        return streamAttributes().map([](const StreamAttributes& attributes) { return Fields{attributes.json_str()}; });
      case RpcCommand::StartVideo:
        [[fallthrough]];
      case RpcCommand::StopVideo:
        return Future<Fields>::Failed(
            Error(ErrorKind::InvalidArgument,
                  fmt::format("{} is bound to a client session", RpcCommandName(request.code))));
      default:
        return Future<Fields>::Failed(
            Error(ErrorKind::InvalidArgument, fmt::format("unknown command code {}", request.code)));
    }
  } catch (const FutureError& ex) {
    return Future<Fields>::Failed(ex.error());
  } catch (const std::exception& ex) {
    log::error("Command {} threw: {}", RpcCommandName(request.code), ex.what());
    return Future<Fields>::Failed(Error(ErrorKind::Internal, ex.what()));
  }
}

Future<std::string> CommandExecutor::describe() { return Future<std::string>::Resolved(_target->description()); }

Future<std::vector<std::string>> CommandExecutor::listPath(std::string path) {
  auto commands = _target->fileCommands();
  if (!commands) {
    return Future<std::vector<std::string>>::Failed(commands.error());
  }
  return (*commands)->listPath(std::move(path));
}

Future<std::string> CommandExecutor::pull(std::string path, std::string_view encoding) {
  if (!IsKnownEncoding(encoding)) {
    return Future<std::string>::Failed(UnknownEncoding(encoding));
  }
  auto commands = _target->fileCommands();
  if (!commands) {
    return Future<std::string>::Failed(commands.error());
  }
  std::filesystem::path hostPath = _temporaryDirectory->newPath("pull");
  const bool gzip = encoding == kGzipEncoding;
  return (*commands)->pull(std::move(path), hostPath).map([gzip](const std::filesystem::path& pulled) {
    std::string content = ReadHostFile(pulled);
    RemoveQuietly(pulled);
    if (!gzip) {
      return content;
    }
    std::string compressed;
    GzipCompress(content, compressed);
    return compressed;
  });
}

Future<Void> CommandExecutor::push(std::string destinationDirectory, std::string_view fileName,
                                   std::string_view content, std::string_view encoding) {
  if (fileName.empty() || fileName == "." || fileName == ".." || fileName.find('/') != std::string_view::npos) {
    return Future<Void>::Failed(
        Error(ErrorKind::InvalidArgument, fmt::format("invalid file name '{}' for push", fileName)));
  }
  if (!IsKnownEncoding(encoding)) {
    return Future<Void>::Failed(UnknownEncoding(encoding));
  }
  std::string decompressed;
  if (encoding == kGzipEncoding) {
    if (!GzipDecompress(content, _maxDecompressedBytes, decompressed)) {
      return Future<Void>::Failed(Error(ErrorKind::InvalidArgument,
                                        fmt::format("corrupted gzip payload, or larger than {} bytes once decompressed",
                                                    _maxDecompressedBytes)));
    }
    content = decompressed;
  }
  auto commands = _target->fileCommands();
  if (!commands) {
    return Future<Void>::Failed(commands.error());
  }

  // The file name is kept by the push, so each payload gets its own staging directory.
  std::filesystem::path staging = _temporaryDirectory->newPath("push");
  std::error_code ec;
  std::filesystem::create_directory(staging, ec);
  if (ec) {
    return Future<Void>::Failed(Error(ErrorKind::DeviceError,
                                      fmt::format("unable to create staging directory {}", staging.string()),
                                      ec.value()));
  }
  std::filesystem::path hostFile = staging / fileName;
  try {
    WriteHostFile(hostFile, content);
  } catch (const FutureError& ex) {
    RemoveQuietly(staging);
    return Future<Void>::Failed(ex.error());
  }
  return (*commands)->push(hostFile, std::move(destinationDirectory)).onComplete([staging](const Future<Void>&) {
    RemoveQuietly(staging);
  });
}

Future<Void> CommandExecutor::remove(std::vector<std::string> paths) {
  auto commands = _target->fileCommands();
  if (!commands) {
    return Future<Void>::Failed(commands.error());
  }
  return (*commands)->remove(std::move(paths));
}

Future<Void> CommandExecutor::move(std::vector<std::string> sources, std::string destinationDirectory) {
  auto commands = _target->fileCommands();
  if (!commands) {
    return Future<Void>::Failed(commands.error());
  }
  return (*commands)->move(std::move(sources), std::move(destinationDirectory));
}

Future<Void> CommandExecutor::makeDirectory(std::string path) {
  auto commands = _target->fileCommands();
  if (!commands) {
    return Future<Void>::Failed(commands.error());
  }
  return (*commands)->makeDirectory(std::move(path));
}

Future<StreamAttributes> CommandExecutor::streamAttributes() {
  auto stream = createVideoStream();
  if (!stream) {
    return Future<StreamAttributes>::Failed(stream.error());
  }
  // This stream is never started, dropping it completes it.
  return (*stream)->streamAttributes();
}

std::expected<std::shared_ptr<BitmapStream>, Error> CommandExecutor::createVideoStream() {
  return _target->createBitmapStream(_scheduler);
}

}  // namespace companion
