#include "repocat/app.hpp"

int main(int argc, char** argv) {
    repocat::App app;
    return app.run(argc, argv);
}
