#include "core/app.hpp"
#include "core/command_line.hpp"
#include "core/session/round_result.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr int kMaxSteps = 100000;

}

int main(int argc, char** argv) {
    auto cmd = flit::parseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    if (!cmd) {
        return -1;
    }

    flit::App app;
    if (!app.init(cmd->configPath)) {
        return -1;
    }

    bool started = cmd->seed ? app.startSeededRound(*cmd->seed, cmd->round.clues)
                             : app.startRound(cmd->round);
    if (!started) {
        std::cerr << "Failed to start round" << std::endl;
        return -1;
    }

    std::cout << app.session()->clue().displayText() << std::endl;
    for (int i = 0; i < cmd->hints; ++i) {
        app.useHint();
    }

    for (int step = 0; step < kMaxSteps && !app.session()->isCompleted(); ++step) {
        app.update(flit::App::FIXED_DT);
    }

    if (!app.session()->isCompleted()) {
        std::cerr << "Round did not finish" << std::endl;
        return -1;
    }

    std::cout << flit::RoundResult::fromSession(*app.session()).toJson().dump(2) << std::endl;
    app.endRound();
    return 0;
}
