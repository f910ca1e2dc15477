#include "rangeget/config.hpp"
#include "rangeget/console_progress.hpp"
#include "rangeget/detail/curl_utils.hpp"
#include "rangeget/logging.hpp"
#include "rangeget/range_downloader.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include <pthread.h>
#include <signal.h>

#include <spdlog/spdlog.h>

namespace {

constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-d <directory>] [-t <streams>] [-c <chunk size>] [-b <buffer size>]"
                 " [-a <authorization>] [-i <id>] [-s <size>] [-v] <url> <file>"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Set download directory (default: current directory)\n"
              << "  -t <streams>     Number of parallel streams (default: 8)\n"
              << "  -c <size>        Nominal chunk size, e.g. 16M (default: 16M)\n"
              << "  -b <size>        Read buffer per stream, e.g. 128K (default: 128K)\n"
              << "  -a <value>       Authorization header value\n"
              << "  -i <id>          Name shown in the progress display\n"
              << "  -s <size>        Known size of the resource, used when the server omits it\n"
              << "  -v               Verbose logging (repeat for libcurl traces)\n"
              << "  -h, --help       Show this message\n"
              << "Environment: RANGEGET_STREAMS, RANGEGET_CHUNK_SIZE, RANGEGET_BUFFER_SIZE,\n"
              << "             RANGEGET_AUTH, SPDLOG_LEVEL" << std::endl;
}

// Waits for SIGINT/SIGTERM on a dedicated thread and cancels the download.
// The signals must already be blocked in every other thread.
class SignalWatcher {
public:
    explicit SignalWatcher(rangeget::DownloadTask& task) : task_(task) {
        thread_ = std::thread([this]() { watch(); });
    }

    ~SignalWatcher() {
        done_ = true;
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    static void blockSignals() {
        sigset_t set = signalSet();
        pthread_sigmask(SIG_BLOCK, &set, nullptr);
    }

private:
    static sigset_t signalSet() {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        return set;
    }

    void watch() {
        const sigset_t set = signalSet();
        const timespec timeout{0, 100 * 1000 * 1000};
        while (!done_) {
            const int sig = sigtimedwait(&set, nullptr, &timeout);
            if (sig == SIGINT || sig == SIGTERM) {
                spdlog::warn("Received signal {}, cancelling", sig);
                task_.cancel();
            }
        }
    }

    rangeget::DownloadTask& task_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // namespace

int main(int argc, char** argv) {
    try {
        rangeget::TransferJob job;
        std::filesystem::path download_dir = std::filesystem::current_path();
        int verbosity = 0;
        int arg_index = 1;

        rangeget::applyEnvironment(job.options);
        if (const char* auth = std::getenv("RANGEGET_AUTH")) {
            job.auth_header = auth;
        }

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            }
            if (option == "-v" || option == "-vv") {
                verbosity += static_cast<int>(option.size()) - 1;
                ++arg_index;
                continue;
            }

            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return kExitUsage;
            }
            const std::string value = argv[arg_index + 1];

            if (option == "-d") {
                download_dir = value;
                std::error_code ec;
                std::filesystem::create_directories(download_dir, ec);
                if (ec) {
                    throw std::runtime_error("Failed to create download directory: "
                        + download_dir.string() + " - " + ec.message());
                }
            } else if (option == "-t") {
                try {
                    job.options.stream_count = std::stoi(value);
                } catch (const std::exception&) {
                    throw std::invalid_argument("Invalid stream count: " + value);
                }
            } else if (option == "-c") {
                job.options.chunk_size = rangeget::parseByteSize(value);
            } else if (option == "-b") {
                job.options.buffer_size = static_cast<std::size_t>(rangeget::parseByteSize(value));
            } else if (option == "-a") {
                job.auth_header = value;
            } else if (option == "-i") {
                job.display_id = value;
            } else if (option == "-s") {
                job.known_size = rangeget::parseByteSize(value);
            } else {
                printUsage(argv[0]);
                return kExitUsage;
            }
            arg_index += 2;
        }

        if (argc - arg_index != 2) {
            printUsage(argv[0]);
            return kExitUsage;
        }

        rangeget::validateOptions(job.options);
        job.url = argv[arg_index];
        job.destination = (download_dir / argv[arg_index + 1]).string();

        rangeget::setupLogging(verbosity);
        rangeget::detail::ensureCurlInitialized();
        SignalWatcher::blockSignals();

        rangeget::ConsoleProgress display(std::cout);
        rangeget::RangeDownloader downloader(job, [&display](const rangeget::Progress& progress) {
            display(progress);
        });

        rangeget::TransferResult result;
        {
            SignalWatcher watcher(downloader);
            result = downloader.run();
        }

        switch (result.outcome) {
        case rangeget::TransferOutcome::Completed:
            return 0;
        case rangeget::TransferOutcome::Cancelled:
            std::cerr << "Download cancelled" << std::endl;
            return kExitCancelled;
        case rangeget::TransferOutcome::Failed:
            std::cerr << "Download failed: " << result.message << std::endl;
            if (result.failed_chunks > 0) {
                std::cerr << "Partial file kept at " << job.destination << std::endl;
            }
            return kExitFailed;
        }
        return kExitFailed;
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        printUsage(argv[0]);
        return kExitUsage;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return kExitFailed;
    }
}
