#ifndef AUXON_VERSION_H
#define AUXON_VERSION_H

#define AUXON_VERSION "0.1.0"

#endif // AUXON_VERSION_H
