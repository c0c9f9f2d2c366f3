#ifndef o3skim_yaml_util_h
#define o3skim_yaml_util_h

/// @file

#include "o3skim_config.h"
#include "o3skim_metadata.h"

#include <iosfwd>
#include <string>

namespace YAML
{
class Node;
class Emitter;
}

/// Conversions between metadata objects and YAML documents.
namespace o3skim_yaml_util
{
/** convert a YAML node to metadata. maps become mappings, sequences become
 * sequences and scalars keep their type. plain scalars are tried as
 * integer, boolean and floating point in that order, quoted scalars are
 * always strings. null values become empty mappings. return 0 if
 * successful.
 */
O3SKIM_EXPORT
int from_yaml(const YAML::Node &node, o3skim_metadata &md);

/** convert a scalar YAML node to a string. return 0 if the node is a
 * scalar.
 */
O3SKIM_EXPORT
int get_string(const YAML::Node &node, std::string &str);

/// emit the metadata as YAML. return 0 if successful
O3SKIM_EXPORT
int to_yaml(const o3skim_metadata &md, YAML::Emitter &out);

/// parse a YAML document from a string. return 0 if successful
O3SKIM_EXPORT
int read_string(const std::string &doc, o3skim_metadata &md);

/// send the metadata to a stream as YAML. return 0 if successful
O3SKIM_EXPORT
int write_stream(std::ostream &os, const o3skim_metadata &md);

/** read a metadata sidecar file. return 0 if successful.
 */
O3SKIM_EXPORT
int read_metadata(const std::string &file_name, o3skim_metadata &md);

/** write the metadata to a sidecar file. an existing file is replaced.
 * return 0 if successful.
 */
O3SKIM_EXPORT
int write_metadata(const std::string &file_name, const o3skim_metadata &md);
}

#endif
