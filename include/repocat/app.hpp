#pragma once

namespace repocat {

class App {
public:
    App();
    int run(int argc, char** argv);
};

} // namespace repocat
