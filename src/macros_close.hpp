// Undoes everything defined in `macros_open.hpp`.
#undef required
#undef interface
#undef unreachable
#undef assert
