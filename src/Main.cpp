#include "Interface.hpp"
#include <iostream>
#include <string>

// Usage: shogi_gui [diagram-file]
int main(int argc, char** argv) {
    std::string diagram_path = (argc > 1) ? argv[1] : "";
    std::cout << "Starting Shogi board" << std::endl;
    GUI::Launch(diagram_path);
    return 0;
}
