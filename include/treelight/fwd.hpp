#ifndef TREELIGHT_FWD_HPP
#define TREELIGHT_FWD_HPP

#include <cstdint>

#include "treelight/settings.hpp"

namespace treelight {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

struct Anchored_Child;
struct Any_Of_Predicate;
struct Assertion_Failure;
struct Assertion_Parse_Error;
enum struct Assertion_Parse_Error_Kind : Default_Underlying;
template <typename>
struct Basic_Transparent_String_View_Equals;
template <typename>
struct Basic_Transparent_String_View_Hash;
struct Capture;
struct Collected_Diagnostic;
struct Collecting_Logger;
struct Diagnostic;
struct Empty_Language_Registry;
struct Error_Tag;
enum struct Event_Kind : Default_Underlying;
struct Fragment;
struct Highlight_Assertion;
struct Highlight_Assignment;
struct Highlight_Event;
struct Highlight_Options;
struct Highlight_Resolution;
struct Highlight_Run;
struct Highlight_Span;
struct Ignorant_Logger;
struct Injection_Layer;
struct Injection_Site;
struct Language_Config;
struct Language_Config_Error;
struct Language_Map;
struct Language_Parser;
struct Language_Query_Sources;
struct Language_Registry;
struct Local_Definition;
struct Local_Reference;
struct Local_Scope;
struct Logger;
struct Match_Options;
enum struct Match_Status : Default_Underlying;
struct Ostream_Logger;
enum struct Parse_Error : Default_Underlying;
enum struct Pattern_Locality : Default_Underlying;
struct Pattern_Node;
enum struct Pattern_Node_Kind : Default_Underlying;
struct Property_Predicate;
enum struct Quantifier : Default_Underlying;
struct Query;
struct Query_Error;
enum struct Query_Error_Kind : Default_Underlying;
struct Query_Match;
struct Query_Pattern;
struct Query_Property;
enum struct Query_Set : Default_Underlying;
struct Query_Source;
struct Query_Warning;
enum struct Query_Warning_Kind : Default_Underlying;
struct Reg_Exp;
enum struct Reg_Exp_Error_Code : Default_Underlying;
enum struct Reg_Exp_Status : Default_Underlying;
struct Reserved_Captures;
template <typename, typename>
struct Result;
struct Scope_Tracker;
enum struct Severity : Default_Underlying;
struct Source_Position;
struct Source_Span;
struct Sub_Document;
struct Success_Tag;
struct Syntax_Node;
struct Syntax_Tree;
struct Syntax_Tree_Builder;
struct Text_Equality_Predicate;
struct Text_Match_Predicate;
enum struct Tree_Build_Error : Default_Underlying;
struct Unknown_Predicate;

using Transparent_String_View_Equals8 = Basic_Transparent_String_View_Equals<char8_t>;
using Transparent_String_View_Hash8 = Basic_Transparent_String_View_Hash<char8_t>;

/// @brief Index of a node within the arena of a `Syntax_Tree`.
/// Node indices are assigned in pre-order,
/// so comparing indices compares nodes in document order.
enum struct Node_Index : std::uint32_t { none = std::uint32_t(-1) };

/// @brief An interned string within a `Syntax_Tree`,
/// such as the kind of a node or the name of a field.
enum struct Symbol : std::uint32_t { none = std::uint32_t(-1) };

/// @brief Index of a capture name within a `Query`.
enum struct Capture_Id : std::uint32_t { none = std::uint32_t(-1) };

/// @brief Index of a scope within a `Scope_Tracker`.
/// The special value `root = 0` is the implicit outermost scope.
enum struct Scope_Index : std::uint32_t { root = 0, none = std::uint32_t(-1) };

} // namespace treelight

#endif
