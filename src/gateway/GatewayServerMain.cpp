#include <cxxopts.hpp>

#include "GatewayServer.hpp"
#include "LogHandler.hpp"
#include "SubprocessUtils.hpp"
#include "TmuxMultiplexer.hpp"

using namespace tg;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tg::HandleTerminate();

  // Override easylogging handler for sigint until the server takes over
  ::signal(SIGINT, tg::InterruptSignalHandler);
  // Writes to closed sockets and ptys are reported through error codes
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("tgserver",
                           "WebSocket gateway to persistent tmux sessions");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Port to listen on", cxxopts::value<int>())  //
        ("bindip", "IP to listen on", cxxopts::value<string>())  //
        ("echo", "Serve an in-memory echo terminal instead of tmux")  //
        ("sandboxid", "Identity of this host in activity reports",
         cxxopts::value<string>())  //
        ("tmuxsocket", "Use a dedicated tmux server socket (tmux -L)",
         cxxopts::value<string>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("logdir", "Directory for log files", cxxopts::value<string>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tgserver version " << TG_VERSION << endl;
      exit(0);
    }

    GatewayConfig config;
    config.layoutDirectory = GetHomeDirectory() + "/.termgate";
    config.logDirectory = GetTempDirectory() + "termgate";
    try {
      config.applyEnvironment();
      string cfgfilename = result["cfgfile"].as<string>();
      if (!cfgfilename.empty()) {
        config.applyIniFile(cfgfilename);
      }
    } catch (const std::runtime_error &e) {
      STFATAL << e.what();
    } catch (const std::invalid_argument &e) {
      CLOG(INFO, "stdout") << "Invalid configuration: " << e.what() << endl;
      exit(1);
    }

    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("bindip")) {
      config.bindIp = result["bindip"].as<string>();
    }
    if (result.count("echo")) {
      config.echoMode = true;
    }
    if (result.count("sandboxid")) {
      config.sandboxId = result["sandboxid"].as<string>();
    }
    if (result.count("tmuxsocket")) {
      config.tmuxSocket = result["tmuxsocket"].as<string>();
    }
    if (result.count("verbose")) {
      config.verboseLevel = result["verbose"].as<int>();
    }
    if (result.count("logtostdout")) {
      config.logToStdout = true;
    }
    if (result.count("logdir")) {
      config.logDirectory = result["logdir"].as<string>();
    }

    try {
      config.validate();
    } catch (const std::invalid_argument &e) {
      CLOG(INFO, "stdout") << "Invalid configuration: " << e.what() << endl;
      exit(1);
    }

    LogOptions logOptions;
    logOptions.directory = config.logDirectory;
    logOptions.logToStdout = config.logToStdout;
    // Redirect std streams to a file
    logOptions.redirectStderrToFile = !config.logToStdout;
    logOptions.silent = config.silent;
    logOptions.verboseLevel = config.verboseLevel;
    logOptions.maxLogSize = config.maxLogSize;
    string logFile = LogHandler::configure(&defaultConf, logOptions);
    // set thread name
    el::Helpers::setThreadName("tgserver-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
    LOG(INFO) << "tgserver " << TG_VERSION << " logging to " << logFile;

    asio::io_context io;
    shared_ptr<GatewayContext> context(new GatewayContext(config));
    shared_ptr<SubprocessUtils> subprocessUtils(new SubprocessUtils());
    shared_ptr<Multiplexer> multiplexer(new TmuxMultiplexer(
        subprocessUtils, config.tmuxBinary, config.tmuxSocket));

    GatewayServer server(io, context, multiplexer);
    try {
      server.start();
    } catch (const std::runtime_error &e) {
      STFATAL << e.what();
    }
    server.handleSignals();
    CLOG(INFO, "stdout") << "Terminal server listening on " << config.bindIp
                         << ":" << server.getPort() << endl;
    io.run();
    LOG(INFO) << "tgserver shut down";
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
}
