#pragma once

#include <stdexcept>
#include <string>

/*
        Source dataset or override file could not be read, or a record is malformed
*/
class LoadError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/*
        Two records claim the same identity, or an override/remap points at nothing
*/
class MergeConflictError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class SerializationError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/*
        Geometry that cannot produce a single valid page
*/
class LayoutError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/*
        A single image could not be fetched or decoded, only ever affects its own slot
*/
class AssetError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class GenerationCancelled : public std::runtime_error
{
  public:
    GenerationCancelled()
        : std::runtime_error{ "Sheet generation was cancelled" }
    {
    }
};
