#pragma once
#include <string>
#include <variant>
#include <vector>
#include <map>
namespace tollgate {
struct JNull{};
using JVal = std::variant<JNull, bool, double, std::string, std::vector<class JNode>, std::map<std::string, class JNode>>;
class JNode { public: JVal v; };
using JArray = std::vector<JNode>;
using JObject = std::map<std::string, JNode>;

bool json_parse(const std::string& s, JNode& out);
// Compact output. Integral numbers below 2^53 are printed without exponent.
std::string json_dump(const JNode& n);

// Construction helpers
JNode jstr(const std::string& s);
JNode jnum(double d);
JNode jbool(bool b);
JNode jnull();
JNode jobj(JObject o = {});
JNode jarr(JArray a = {});

inline bool json_is_object(const JNode& n){ return std::holds_alternative<JObject>(n.v); }
inline bool json_is_array(const JNode& n){ return std::holds_alternative<JArray>(n.v); }
inline bool json_is_string(const JNode& n){ return std::holds_alternative<std::string>(n.v); }
inline bool json_is_null(const JNode& n){ return std::holds_alternative<JNull>(n.v); }

// Object member lookup; nullptr when `obj` is not an object or the key is absent.
const JNode* json_get(const JNode& obj, const std::string& key);
// True only when the member exists and is a string.
bool json_get_string(const JNode& obj, const std::string& key, std::string& out);
bool json_get_number(const JNode& obj, const std::string& key, double& out);
bool json_get_bool(const JNode& obj, const std::string& key, bool& out);
std::string json_string_or(const JNode& obj, const std::string& key, const std::string& def = "");
}
