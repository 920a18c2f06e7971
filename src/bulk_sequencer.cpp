#include "bulk_sequencer.hpp"
#include "console.hpp"
#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

const BulkVerb INSTALL_VERB{"Installing", "installed"};
const BulkVerb UNINSTALL_VERB{"Uninstalling", "uninstalled"};
const BulkVerb UPGRADE_VERB{"Upgrading", "upgraded"};

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string error_line(const BulkVerb& verb, const std::string& item, const std::string& reason) {
    return "Error " + lowercase(verb.progressive) + " " + item + ": " + reason + "\n";
}

// Pulls one item's stream to exhaustion before the next item is started.
class SequencedOutputStream final : public OutputStream {
public:
    SequencedOutputStream(std::vector<std::string> items, BulkVerb verb, StreamOperation operation)
        : items_(std::move(items)), verb_(std::move(verb)), operation_(std::move(operation)) {}

    std::optional<std::string> next() override {
        while (true) {
            if (current_) {
                if (auto chunk = current_->next()) return chunk;
                current_.reset();
            }
            if (started_ < announced_) {
                start(items_[started_++]);
                continue;
            }
            if (announced_ >= items_.size()) return std::nullopt;
            return bulk_banner(verb_, items_[announced_++]);
        }
    }

    void terminate() override {
        if (current_) current_->terminate();
    }

private:
    void start(const std::string& item) {
        try {
            current_ = operation_(item);
        } catch (const std::exception& e) {
            print_debug("bulk item " + item + " failed to start: " + e.what());
            current_ = std::make_unique<TextOutputStream>(
                std::vector<std::string>{error_line(verb_, item, e.what())});
        }
    }

    std::vector<std::string> items_;
    BulkVerb verb_;
    StreamOperation operation_;
    OutputStreamPtr current_;
    size_t announced_ = 0;
    size_t started_ = 0;
};

} // namespace

std::string bulk_banner(const BulkVerb& verb, const std::string& item) {
    return "==> " + verb.progressive + " " + item + "...\n";
}

OutputStreamPtr sequence_streams(std::vector<std::string> items,
                                 BulkVerb verb,
                                 StreamOperation operation) {
    return std::make_unique<SequencedOutputStream>(std::move(items), std::move(verb), std::move(operation));
}

OutputStreamPtr sequence_actions(std::vector<std::string> items,
                                 BulkVerb verb,
                                 ItemAction action) {
    BulkVerb captured = verb;
    StreamOperation operation = [action, captured](const std::string& item) -> OutputStreamPtr {
        std::string line;
        try {
            action(item);
            line = "Successfully " + captured.past + " " + item + "\n";
        } catch (const std::exception& e) {
            line = error_line(captured, item, e.what());
        }
        return std::make_unique<TextOutputStream>(std::vector<std::string>{line});
    };
    return sequence_streams(std::move(items), std::move(verb), std::move(operation));
}
