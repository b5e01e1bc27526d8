#pragma once

#include "engine/Types.hpp"

#include <string>

namespace rt::engine
{

struct TransferAddedEvent
{
    Transfer transfer;
};

struct TransferRemovedEvent
{
    std::string id;
};

struct TransferDoneEvent
{
    Transfer transfer;
};

struct TransferErrorEvent
{
    Transfer transfer;
    std::string message;
};

// Published once per transfer on every poll tick.
struct TransferProgressEvent
{
    Transfer transfer;
};

struct HistoryChangedEvent
{
    bool persisted = true;
    std::string error;
};

} // namespace rt::engine
