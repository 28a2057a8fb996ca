#pragma once
#include <string>

namespace GUI {
    // Opens the board window. An empty path starts from the standard layout;
    // otherwise the file is read as a board diagram.
    void Launch(const std::string& start_diagram_path);
}
