/**
 * @file upload_download_example.cpp
 * @brief Upload a file to a block blob and download it back
 *
 * This example demonstrates:
 * - Building an endpoint from a storage connection string
 * - Uploading with progress reporting, HTTP headers and metadata
 * - Downloading the whole blob or a byte range into a local file
 * - Reporting service errors with their HTTP status and service code
 *
 * The HTTP transport comes from network_system; build with
 * BUILD_WITH_NETWORK_SYSTEM to run against a real account or Azurite.
 */

#include <kcenon/blob_transfer/blob_transfer.h>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::blob_transfer;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

void print_error(const std::string& what, const error& err) {
    std::cerr << "Error: " << what << ": " << err.message << std::endl;
    std::cerr << "  code:      " << to_string(err.code) << " (" << static_cast<int>(err.code)
              << ")" << std::endl;
    if (err.status_code != 0) {
        std::cerr << "  status:    " << err.status_code << std::endl;
    }
    if (!err.service_code.empty()) {
        std::cerr << "  service:   " << err.service_code << std::endl;
    }
    if (err.condition != condition_kind::none) {
        std::cerr << "  condition: " << to_string(err.condition) << std::endl;
    }
}

auto make_progress(const std::string& label) -> progress_callback {
    auto output_mutex = std::make_shared<std::mutex>();
    return [label, output_mutex](uint64_t transferred, uint64_t total) {
        std::lock_guard lock(*output_mutex);
        double percent = total > 0 ? 100.0 * static_cast<double>(transferred) /
                                         static_cast<double>(total)
                                   : 100.0;
        std::cout << "\r" << label << ": " << format_bytes(transferred) << " / "
                  << format_bytes(total) << " (" << std::fixed << std::setprecision(1)
                  << percent << "%)" << std::flush;
        if (transferred == total) {
            std::cout << std::endl;
        }
    };
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Upload/Download Example - Blob Transfer" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file> <container> <blob>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -b, --block-size <bytes>  Staged block size (default: 8388608)" << std::endl;
    std::cout << "  -p, --parallel <n>        Parallel requests (default: 5)" << std::endl;
    std::cout << "  -o, --output <path>       Download destination (default: <local_file>.out)"
              << std::endl;
    std::cout << "  -r, --range <off>:<len>   Download only this byte range" << std::endl;
    std::cout << "  --help                    Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "The connection string is read from AZURE_STORAGE_CONNECTION_STRING." << std::endl;
}

int main(int argc, char* argv[]) {
    uint64_t block_size = 8 * 1024 * 1024;
    int parallelism = upload_options::default_parallelism;
    std::string local_path;
    std::string container;
    std::string blob_name;
    std::string output_path;
    std::optional<blob_range> range;

    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-b" || arg == "--block-size") {
            if (++i >= argc) {
                std::cerr << "Error: --block-size requires an argument" << std::endl;
                return 1;
            }
            block_size = std::stoull(argv[i]);
        } else if (arg == "-p" || arg == "--parallel") {
            if (++i >= argc) {
                std::cerr << "Error: --parallel requires an argument" << std::endl;
                return 1;
            }
            parallelism = std::stoi(argv[i]);
        } else if (arg == "-o" || arg == "--output") {
            if (++i >= argc) {
                std::cerr << "Error: --output requires an argument" << std::endl;
                return 1;
            }
            output_path = argv[i];
        } else if (arg == "-r" || arg == "--range") {
            if (++i >= argc) {
                std::cerr << "Error: --range requires an argument" << std::endl;
                return 1;
            }
            std::string range_arg = argv[i];
            auto colon = range_arg.find(':');
            if (colon == std::string::npos) {
                range = blob_range(std::stoull(range_arg));
            } else {
                range = blob_range(std::stoull(range_arg.substr(0, colon)),
                                   std::stoull(range_arg.substr(colon + 1)));
            }
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 3) {
        print_usage(argv[0]);
        return 1;
    }
    local_path = positional[0];
    container = positional[1];
    blob_name = positional[2];
    if (output_path.empty()) {
        output_path = local_path + ".out";
    }

    const char* connection_string = std::getenv("AZURE_STORAGE_CONNECTION_STRING");
    if (connection_string == nullptr) {
        std::cerr << "Error: AZURE_STORAGE_CONNECTION_STRING is not set" << std::endl;
        return 1;
    }

    auto endpoint = azure_blob_endpoint::from_connection_string(connection_string, container,
                                                                blob_name);
    if (!endpoint) {
        print_error("invalid connection string", endpoint.error());
        return 1;
    }

    auto blob = azure_block_blob_client::create(endpoint.value());
    if (!blob) {
        print_error("cannot create blob client", blob.error());
        return 1;
    }

    auto manager = transfer_manager::builder().with_default_parallelism(parallelism).build();
    if (!manager) {
        print_error("invalid configuration", manager.error());
        return 1;
    }

    std::cout << "Uploading " << local_path << " to " << blob.value()->url() << std::endl;

    upload_options upload_opts;
    upload_opts.http_headers.content_type = "application/octet-stream";
    upload_opts.metadata["source"] = "upload_download_example";
    upload_opts.progress = make_progress("upload");

    auto uploaded = manager.value().upload_file(local_path, blob.value(), block_size, upload_opts);
    if (!uploaded) {
        print_error("upload failed", uploaded.error());
        return 1;
    }
    std::cout << "Uploaded " << format_bytes(uploaded.value().bytes_uploaded) << " ("
              << to_string(uploaded.value().strategy) << ", " << uploaded.value().block_count
              << " blocks, etag " << uploaded.value().etag << ")" << std::endl;

    download_options download_opts;
    download_opts.progress = make_progress("download");

    auto downloaded =
        manager.value().download_file(blob.value(), output_path, range, download_opts);
    if (!downloaded) {
        print_error("download failed", downloaded.error());
        return 1;
    }
    std::cout << "Downloaded to " << output_path << " (blob size "
              << format_bytes(downloaded.value().content_length) << ", etag "
              << downloaded.value().etag << ")" << std::endl;

    return 0;
}
