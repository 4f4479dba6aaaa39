#include <iostream>
#include <string>
#include "cli/prompt_merge_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"
#include "platform/platform.hpp"

int main(int argc, char** argv) {
    try {
        theme::color_enabled() = platform::stdout_is_tty();
        theme::stderr_color_enabled() = platform::stderr_is_tty();

        PromptMergeCLI cli(std::cout, std::cerr);
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        theme::StderrColor color;
        std::cerr << theme::fail(std::string(e.what()));
        return PM_EXIT_INTERNAL;
    }
}
