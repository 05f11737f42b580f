#include "app/DaemonMain.hpp"

int main(int argc, char *argv[])
{
    return tmax::app::daemon_main(argc, argv);
}
