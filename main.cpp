#include <clocale>
#include <exception>
#include <iostream>

#include "app/TaskWalkerApp.hpp"

int main(int, char**) {
    std::setlocale(LC_ALL, "");
    try {
        taskwalker::app::TaskWalkerApp app;
        return app.Run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
