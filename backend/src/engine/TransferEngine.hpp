#pragma once

#include "engine/Types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace rt::engine
{

// Thrown by TransferEngine::start_transfer for locators it cannot parse.
class InvalidLocatorError : public std::invalid_argument
{
  public:
    using std::invalid_argument::invalid_argument;
};

// One transfer inside the engine. Members may be called from any thread;
// once the transfer has been removed, calls throw.
class TransferHandle
{
  public:
    virtual ~TransferHandle() = default;

    virtual std::string const &id() const noexcept = 0;
    virtual EngineCounters counters() const = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
    // Empty until metadata is available.
    virtual std::vector<EngineFile> files() const = 0;
    // Copies up to out.size() bytes of a file starting at offset. Returns 0
    // when that range has not been downloaded yet.
    virtual std::size_t read(int file_index, std::uint64_t offset,
                             std::span<char> out) = 0;
    // Asks the engine to fetch the given range of a file before anything else.
    virtual void prioritize(int file_index, std::uint64_t offset,
                            std::uint64_t length) = 0;
};

using FaultCallback =
    std::function<void(std::string const &id, std::string const &message)>;

// Swarm engine as seen by the download manager.
class TransferEngine
{
  public:
    virtual ~TransferEngine() = default;

    // Brings the engine up; throws on failure. May block.
    virtual void start() = 0;
    virtual void shutdown() = 0;

    virtual std::optional<std::string>
    content_id(std::string const &locator) const = 0;
    // Throws InvalidLocatorError, or std::runtime_error for engine failures.
    virtual std::shared_ptr<TransferHandle>
    start_transfer(std::string const &locator) = 0;
    virtual std::shared_ptr<TransferHandle>
    lookup(std::string const &id) const = 0;
    virtual void remove(TransferHandle &handle) = 0;

    virtual void set_fault_callback(FaultCallback callback) = 0;
    // Drains pending engine notifications, invoking callbacks on the calling
    // thread.
    virtual void pump() = 0;
};

// Serves transfer files over the network.
class StreamPublisher
{
  public:
    virtual ~StreamPublisher() = default;

    virtual std::shared_ptr<StreamEndpoint>
    publish(std::shared_ptr<TransferHandle> handle, EngineFile const &file) = 0;
    // Drops every endpoint and open connection of a transfer.
    virtual void revoke(std::string const &transfer_id) = 0;
};

} // namespace rt::engine
