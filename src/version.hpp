#ifndef AFS_VERSION_HPP
#define AFS_VERSION_HPP

#define AFS_VERSION "1.0.0"

#endif // AFS_VERSION_HPP
