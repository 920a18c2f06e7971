#pragma once

#include "process_runner.hpp"
#include <functional>
#include <string>
#include <vector>

struct BulkVerb {
    std::string progressive;  // "Installing"
    std::string past;         // "installed"
};

extern const BulkVerb INSTALL_VERB;
extern const BulkVerb UNINSTALL_VERB;
extern const BulkVerb UPGRADE_VERB;

using StreamOperation = std::function<OutputStreamPtr(const std::string& item)>;
using ItemAction = std::function<void(const std::string& item)>;

// "==> Installing wget...\n"
std::string bulk_banner(const BulkVerb& verb, const std::string& item);

// Runs `operation` once per item, strictly one after another, and returns the
// combined feed: each item's banner followed by its streamed output. An item
// whose stream cannot be started gets an error line; the rest still run.
OutputStreamPtr sequence_streams(std::vector<std::string> items,
                                 BulkVerb verb,
                                 StreamOperation operation);

// Same for operations that do not stream. Each item yields its banner and then
// either "Successfully <past> <item>" or "Error <progressive> <item>: <reason>".
// A failing item never stops the remaining ones.
OutputStreamPtr sequence_actions(std::vector<std::string> items,
                                 BulkVerb verb,
                                 ItemAction action);
