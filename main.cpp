#include "app/StorykeepApp.hpp"

int main(int argc, char** argv) {
    storykeep::app::StorykeepApp app;
    return app.Run(argc, argv);
}
