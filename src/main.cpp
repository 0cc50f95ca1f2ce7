#include "app/SteamcorderApp.hpp"

int main(int, char**) {
    steamcorder::app::SteamcorderApp app;
    return app.Run();
}
