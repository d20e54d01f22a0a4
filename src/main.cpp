#include "account/credentials.hpp"
#include "catalog/catalog_client.hpp"
#include "config/config.hpp"
#include "io/file_source.hpp"
#include "logger/logger.hpp"
#include "network/http_transport.hpp"
#include "network/network_error.hpp"
#include "network/target_resolver.hpp"
#include "upload/interrupt_guard.hpp"
#include "upload/upload_orchestrator.hpp"
#include <boost/log/trivial.hpp>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace {

constexpr int EXIT_INTERRUPTED = 130;

struct ProgramOptions {
  std::string file;
  std::string folder_id;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " --file <path> [--folder-id <id>]\n"
        << "Required arguments:\n"
        << "  -f, --file       File to encrypt and upload\n"
        << "Optional arguments:\n"
        << "  -d, --folder-id  Destination folder (defaults to the root folder)\n"
        << "Example: " << program_name << " --file ./report.pdf --folder-id 1234\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_map<std::string, std::string ProgramOptions::*> flag_map = {
    {"-f", &ProgramOptions::file},
    {"--file", &ProgramOptions::file},
    {"-d", &ProgramOptions::folder_id},
    {"--folder-id", &ProgramOptions::folder_id}
  };

  ProgramOptions options;

  for (int i = 1; i < argc; i += 2) {
    const std::string flag(argv[i]);
    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    options.*(it->second) = argv[i + 1];
  }

  if (options.file.empty()) {
    std::cerr << "Error: A file is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

// Renders percentages as a single rewriting line on stderr
class ProgressBar {
public:
  void update(unsigned percent) {
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr unsigned width = 40;
    unsigned filled = percent * width / 100;
    std::cerr << "\rUploading [" << std::string(filled, '#') << std::string(width - filled, ' ')
              << "] " << percent << "%" << std::flush;
    drawn_ = true;
  }

  void finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (drawn_) {
      std::cerr << '\n';
      drawn_ = false;
    }
  }

private:
  std::mutex mutex_;
  bool drawn_{false};
};

int run_upload(const ProgramOptions& options) {
  using namespace cirrus;

  config::Config config;
  try {
    config = config::Config::from_environment();
  } catch (const config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }

  try {
    logging::init_logging(config.log_file, config.log_level);
    logging::enable_console_output(logging::severity_level::error);
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to initialize logging: " << e.what() << '\n';
    return 1;
  }
  BOOST_LOG_TRIVIAL(info) << "Main: Starting upload of " << options.file;

  try {
    auto credentials = account::load_credentials(config.credentials_path);
    io::FileSource file(options.file);

    if (file.size() == 0) {
      std::cerr << "Error: " << upload::EmptySourceError().what() << '\n';
      return 1;
    }

    std::string folder_id = options.folder_id;
    if (folder_id.empty()) {
      std::cerr << "Warning: No folder id given, uploading to the root folder\n";
      folder_id = credentials.root_folder_id;
    }

    std::cerr << "Preparing network\n";

    network::HttpTransport::Options transport_options;
    transport_options.timeout = config.timeout;
    transport_options.chunk_size = config.chunk_size;
    auto transport = std::make_shared<network::HttpTransport>(transport_options);

    auto resolver = std::make_shared<network::BridgeTargetResolver>(
      transport, config.network_url, credentials.bridge_user, credentials.bridge_password);

    upload::UploadOrchestrator::Options upload_options;
    upload_options.weighting = network::ProgressWeighting(config.transfer_weight);
    upload_options.chunk_size = config.chunk_size;
    upload::UploadOrchestrator orchestrator(resolver, transport, upload_options);

    ProgressBar bar;
    upload::UploadOptions callbacks;
    callbacks.progress_callback = [&bar](unsigned percent) { bar.update(percent); };

    upload::UploadTarget target;
    target.bucket_id = credentials.bucket_id;
    target.secret = credentials.mnemonic;

    upload::UploadResult result;
    {
      // Installed before the worker starts so no interrupt falls through to the default handler
      upload::InterruptGuard guard(nullptr, [](int signal_number) {
        BOOST_LOG_TRIVIAL(warning) << "Main: Received signal " << signal_number << ", cancelling upload";
      });
      auto handles = orchestrator.upload_from_stream(target, file.stream(), file.size(), callbacks);
      guard.add(handles.abort_handle);

      try {
        result = handles.result.get();
      } catch (const network::TransferAbortedError& e) {
        bar.finish();
        std::cerr << "Upload cancelled: " << e.reason() << '\n';
        return EXIT_INTERRUPTED;
      }
    }
    bar.finish();

    catalog::DriveCatalogClient catalog(transport, config.drive_api_url, credentials.token);
    catalog::FileEntry entry;
    entry.name = file.name();
    entry.type = file.type();
    entry.size = file.size();
    entry.folder_id = folder_id;
    entry.remote_object_id = result.remote_object_id;
    entry.bucket_id = credentials.bucket_id;
    entry.fingerprint = result.fingerprint;

    catalog::CatalogRecord record;
    try {
      record = catalog.register_file(entry);
    } catch (const catalog::RegistrationError& e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Stored object: " << result.remote_object_id << '\n';
      return 1;
    }

    std::cout << "File uploaded: " << config.drive_url << "/file/" << record.uuid << '\n';
    BOOST_LOG_TRIVIAL(info) << "Main: Upload finished as " << record.uuid;
    return 0;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Main: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else {
    return run_upload(options);
  }
}
