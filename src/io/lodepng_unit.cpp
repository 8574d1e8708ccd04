// Single translation unit that compiles LodePNG.
//
// The LodePNG source directory is located by CMake (LODEPNG_INCLUDE_DIR) and added
// to this target's include path, so the upstream implementation is built as part
// of inkcomp_core without a separate rule for an external source path.
//
// Do not include "lodepng.cpp" from anywhere else.
#include "lodepng.cpp"
