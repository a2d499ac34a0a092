#include "app/DocVerifyApp.hpp"

int main(int argc, char** argv) {
    docverify::app::DocVerifyApp app;
    return app.Run(argc, argv);
}
