#include "cubegeo_app.hpp"

int main(int argc, char **argv) {
    return cubegeo::runCubeGeoApplication(argc, argv);
}
