#include <clawdesk/cli/clawdesk_cli.h>
#include <clawdesk/cli/command.h>
#include <clawdesk/cli/json_views.h>
#include <clawdesk/cli/progress_indicator.h>
#include <clawdesk/cli/ui_helpers.hpp>
#include <clawdesk/downloader/progress_channel.h>

#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <ostream>
#include <vector>

namespace clawdesk::cli {

namespace {

std::atomic<downloader::ProgressChannel*> g_activeChannel{nullptr};

void onInterrupt(int) {
    if (auto* channel = g_activeChannel.load()) {
        channel->cancel();
    }
}

// Routes SIGINT to the channel's cancel flag while a download is running.
class InterruptScope {
public:
    explicit InterruptScope(downloader::ProgressChannel& channel) {
        g_activeChannel.store(&channel);
        previous_ = std::signal(SIGINT, onInterrupt);
    }
    ~InterruptScope() {
        std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_);
        g_activeChannel.store(nullptr);
    }
    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;

private:
    void (*previous_)(int) = SIG_DFL;
};

class FetchCommand : public ICommand {
public:
    std::string getName() const override { return "fetch"; }

    std::string getDescription() const override {
        return "Stream a URL to a local file with progress (Ctrl-C cancels)";
    }

    void registerCommand(CLI::App& app, ClawdeskCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("fetch", getDescription());
        cmd->add_option("url", url_, "Source URL (http, https or file)")->required();
        cmd->add_option("dest", dest_, "Destination file (parent directories are created)")
            ->required();
        cmd->add_option("-H,--header", headers_,
                        "Custom header (repeatable), e.g., 'Authorization: Bearer <token>'.");
        cmd->add_flag("--no-progress", noProgress_, "Do not render a progress line");

        cmd->callback([this]() { cli_->setPendingCommand(this); });

        cmd->footer(R"(Behavior:
  - The destination is truncated, then written chunk by chunk as data arrives.
  - On failure or cancel the partial file is left in place.
  - Progress goes to stderr; --json prints the final result on stdout.)");
    }

    Result<void> execute() override {
        downloader::DownloadRequest request;
        request.url = url_;
        request.destination = dest_;
        for (const auto& h : headers_) {
            auto pos = h.find(':');
            if (pos == std::string::npos) {
                return Error{ErrorCode::InvalidArgument,
                             "Invalid header '" + h + "' (expected 'Name: value')"};
            }
            std::string value = h.substr(pos + 1);
            if (!value.empty() && value[0] == ' ') {
                value.erase(0, 1);
            }
            request.headers.push_back({h.substr(0, pos), value});
        }

        auto service = cli_->getService();
        if (!service) {
            return service.error();
        }

        downloader::ProgressChannel channel;
        InterruptScope interrupt(channel);

        auto future = service.value()->fetch(request, channel.progressCallback(),
                                             channel.cancelPredicate());

        ProgressIndicator indicator(ProgressIndicator::Style::Bar);
        indicator.setShowBytes(true);
        if (!noProgress_) {
            indicator.start("Downloading " + dest_);
        }

        std::uint64_t seen = 0;
        while (future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
            auto snapshot = channel.waitForUpdate(seen, std::chrono::milliseconds(100));
            if (snapshot.sequence > seen) {
                seen = snapshot.sequence;
                indicator.update(snapshot.event.downloaded, snapshot.event.total);
            }
        }
        channel.close();
        indicator.stop();

        auto result = future.get();
        if (!result) {
            return result.error();
        }
        const auto& done = result.value();
        spdlog::debug("[Fetch] {} bytes in {} ms", done.bytesWritten, done.elapsed.count());

        if (cli_->getJsonOutput()) {
            cli_->out() << toJson(done).dump(2) << "\n";
        } else {
            cli_->out() << ui::status_ok("Saved " + ui::format_bytes(done.bytesWritten) + " to " +
                                         done.destination.string())
                        << "\n";
        }
        return Result<void>();
    }

private:
    ClawdeskCLI* cli_ = nullptr;
    std::string url_;
    std::string dest_;
    std::vector<std::string> headers_;
    bool noProgress_ = false;
};

} // namespace

std::unique_ptr<ICommand> createFetchCommand() {
    return std::make_unique<FetchCommand>();
}

} // namespace clawdesk::cli
