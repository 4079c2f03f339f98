#include "app/TodoPadApp.hpp"

int main(int, char**) {
    todopad::app::TodoPadApp app;
    return app.Run();
}
