#include "CommandLineApplication.hpp"

namespace quotedesk {

using adapters::primary::CommandRequest;
using adapters::primary::CommandResponse;

CommandLineApplication::CommandLineApplication(std::ostream& out, std::ostream& err)
    : out_(out)
    , err_(err)
{}

int CommandLineApplication::run(int argc, char* argv[]) {
    loadEnvironment(argc, argv);
    configureInjection();
    return start();
}

void CommandLineApplication::loadEnvironment(int argc, char* argv[]) {
    request_ = CommandRequest::parse(argc, argv);
}

int CommandLineApplication::start() {
    std::string command = request_.getCommand();
    if (command.empty() || request_.hasOption("help")) {
        command = "help";
    }

    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        err_ << "Error: Unknown command: " << command << "\n"
             << "Run 'quotedesk help' for usage.\n";
        return adapters::primary::EXIT_INVALID;
    }

    CommandResponse res;
    it->second->handle(request_, res);

    out_ << res.getOutput();
    err_ << res.getError();
    out_.flush();
    return res.getExitCode();
}

} // namespace quotedesk
