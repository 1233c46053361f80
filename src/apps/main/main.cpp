// diagram_text: renders an ERD or requirement diagram description to Mermaid text.
#include "cli.hpp"
#include <string>
#include <vector>

int main(int argc, char* argv[])
{
    const std::vector<std::string> args(argv + 1, argv + argc);
    return diagram_cli::run(argc > 0 ? argv[0] : "diagram_text", args);
}
