#include <iostream>
#include "converter.h"
#include "xml_config.h"


int main(int argc, char **argv)
{
    const std::string project_dir = argc > 1 ? argv[1] : ".";
    cfg::xml_project pro(project_dir);
    if(!pro.valid()) {
        return 1;
    }

    brickify::converter c(pro);
    const size_t num_ok = c.run();

    return num_ok == pro.shapes().size() ? 0 : 1;
}
