#ifndef CASTOREXITCODES_H
#define CASTOREXITCODES_H

#define GENERIC_EXIT_OK                   0
#define GENERIC_EXIT_NOT_OK               1
#define GENERIC_EXIT_INVALID_CMDLINE      2
#define GENERIC_EXIT_SOCKET_ERROR         3
#define GENERIC_EXIT_PLUGIN_ERROR         4
#define GENERIC_EXIT_PORT_ERROR           5

#endif // CASTOREXITCODES_H
