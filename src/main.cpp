#include "app/UpdaterApp.hpp"

int main(int argc, char** argv)
{
    return UpdaterApp{argc, argv}.run();
}
