#include "json.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
namespace tollgate {
static void skip(const std::string& s, size_t& i){ while(i<s.size() && isspace((unsigned char)s[i])) ++i; }
static int hexval(char c){
    if(c>='0'&&c<='9') return c-'0';
    if(c>='a'&&c<='f') return c-'a'+10;
    if(c>='A'&&c<='F') return c-'A'+10;
    return -1;
}
static bool parse_u16(const std::string& s, size_t i, unsigned& out){
    if(i+4>s.size()) return false;
    out=0;
    for(size_t k=0;k<4;++k){ int h=hexval(s[i+k]); if(h<0) return false; out=(out<<4)|(unsigned)h; }
    return true;
}
static void put_utf8(std::string& o, unsigned cp){
    if(cp<0x80) o+=(char)cp;
    else if(cp<0x800){ o+=(char)(0xC0|(cp>>6)); o+=(char)(0x80|(cp&0x3F)); }
    else if(cp<0x10000){ o+=(char)(0xE0|(cp>>12)); o+=(char)(0x80|((cp>>6)&0x3F)); o+=(char)(0x80|(cp&0x3F)); }
    else { o+=(char)(0xF0|(cp>>18)); o+=(char)(0x80|((cp>>12)&0x3F)); o+=(char)(0x80|((cp>>6)&0x3F)); o+=(char)(0x80|(cp&0x3F)); }
}
static bool parse_string(const std::string& s, size_t& i, std::string& out){
    if(i>=s.size() || s[i]!='"') return false; ++i; std::string o;
    while(i<s.size() && s[i]!='"'){
        if(s[i]=='\\'){
            ++i; if(i>=s.size()) return false; char c=s[i];
            if(c=='"'||c=='\\'||c=='/') o+=c;
            else if(c=='b') o+='\b'; else if(c=='f') o+='\f'; else if(c=='n') o+='\n';
            else if(c=='r') o+='\r'; else if(c=='t') o+='\t';
            else if(c=='u'){
                unsigned cp=0; if(!parse_u16(s,i+1,cp)) return false; i+=4;
                if(cp>=0xD800 && cp<=0xDBFF && i+6<s.size() && s[i+1]=='\\' && s[i+2]=='u'){
                    unsigned lo=0; if(!parse_u16(s,i+3,lo)) return false;
                    if(lo>=0xDC00 && lo<=0xDFFF){ cp=0x10000+((cp-0xD800)<<10)+(lo-0xDC00); i+=6; }
                }
                put_utf8(o,cp);
            }
            else return false;
        } else o+=s[i];
        ++i;
    }
    if(i>=s.size()||s[i]!='"') return false; ++i; out=std::move(o); return true;
}
static bool parse_value(const std::string& s, size_t& i, JNode& out, int depth);
static bool parse_array(const std::string& s, size_t& i, JNode& out, int depth){
    if(s[i]!='[') return false; ++i; skip(s,i); JArray arr; if(i<s.size() && s[i]==']'){ ++i; out.v=arr; return true; }
    while(i<s.size()){ JNode val; if(!parse_value(s,i,val,depth+1)) return false; arr.push_back(std::move(val)); skip(s,i); if(i>=s.size()) return false; if(s[i]==','){ ++i; skip(s,i); continue; } if(s[i]==']'){ ++i; out.v=std::move(arr); return true; } return false; }
    return false;
}
static bool parse_object(const std::string& s, size_t& i, JNode& out, int depth){
    if(s[i]!='{') return false; ++i; skip(s,i); JObject obj; if(i<s.size() && s[i]=='}'){ ++i; out.v=obj; return true; }
    while(i<s.size()){ std::string k; if(!parse_string(s,i,k)) return false; skip(s,i); if(i>=s.size()||s[i]!=':') return false; ++i; skip(s,i); JNode val; if(!parse_value(s,i,val,depth+1)) return false; obj[k]=std::move(val); skip(s,i); if(i>=s.size()) return false; if(s[i]==','){ ++i; skip(s,i); continue; } if(s[i]=='}'){ ++i; out.v=std::move(obj); return true; } return false; }
    return false;
}
static bool parse_number(const std::string& s, size_t& i, double& out){
    size_t j=i; if(i<s.size() && s[i]=='-') ++i;
    if(i>=s.size() || !isdigit((unsigned char)s[i])) return false;
    while(i<s.size() && isdigit((unsigned char)s[i])) ++i;
    if(i<s.size() && s[i]=='.'){ ++i; while(i<s.size()&&isdigit((unsigned char)s[i])) ++i; }
    if(i<s.size() && (s[i]=='e'||s[i]=='E')){ ++i; if(i<s.size()&&(s[i]=='+'||s[i]=='-')) ++i; while(i<s.size()&&isdigit((unsigned char)s[i])) ++i; }
    out = std::strtod(s.substr(j, i-j).c_str(), nullptr); return true;
}
static bool parse_value(const std::string& s, size_t& i, JNode& out, int depth){
    if(depth>64) return false;
    skip(s,i); if(i>=s.size()) return false;
    if(s[i]=='"'){ std::string str; if(!parse_string(s,i,str)) return false; out.v=std::move(str); return true; }
    if(s[i]=='{') return parse_object(s,i,out,depth);
    if(s[i]=='[') return parse_array(s,i,out,depth);
    if(s.compare(i,4,"true")==0){ i+=4; out.v=true; return true; }
    if(s.compare(i,5,"false")==0){ i+=5; out.v=false; return true; }
    if(s.compare(i,4,"null")==0){ i+=4; out.v=JNull{}; return true; }
    double num; if(parse_number(s,i,num)){ out.v=num; return true; }
    return false;
}
bool json_parse(const std::string& s, JNode& out){ size_t i=0; bool ok=parse_value(s,i,out,0); if(!ok) return false; skip(s,i); return i==s.size(); }

static void dump_string(const std::string& s, std::ostringstream& o){
    o<<'"';
    for(unsigned char c : s){
        switch(c){
            case '"': o<<"\\\""; break;
            case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break;
            case '\r': o<<"\\r"; break;
            case '\t': o<<"\\t"; break;
            case '\b': o<<"\\b"; break;
            case '\f': o<<"\\f"; break;
            default:
                if(c<0x20){ char buf[8]; std::snprintf(buf,sizeof(buf),"\\u%04x",c); o<<buf; }
                else o<<(char)c;
        }
    }
    o<<'"';
}
static void dump_number(double d, std::ostringstream& o){
    if(std::isfinite(d) && std::floor(d)==d && std::fabs(d)<9007199254740992.0){
        o<<(long long)d;
    } else if(std::isfinite(d)){
        char buf[32]; std::snprintf(buf,sizeof(buf),"%.17g",d); o<<buf;
    } else {
        o<<"null";
    }
}
static void dump(const JNode& n, std::ostringstream& o){
    if(std::holds_alternative<JNull>(n.v)) o<<"null";
    else if(std::holds_alternative<bool>(n.v)) o<<(std::get<bool>(n.v)?"true":"false");
    else if(std::holds_alternative<double>(n.v)) dump_number(std::get<double>(n.v), o);
    else if(std::holds_alternative<std::string>(n.v)) dump_string(std::get<std::string>(n.v), o);
    else if(std::holds_alternative<JArray>(n.v)){ o<<'['; const auto& a=std::get<JArray>(n.v); for(size_t i=0;i<a.size();++i){ if(i) o<<','; dump(a[i],o);} o<<']'; }
    else { o<<'{'; const auto& m=std::get<JObject>(n.v); size_t i=0; for(auto& kv: m){ if(i++) o<<','; dump_string(kv.first,o); o<<':'; dump(kv.second,o);} o<<'}'; }
}
std::string json_dump(const JNode& n){ std::ostringstream o; dump(n,o); return o.str(); }

JNode jstr(const std::string& s){ JNode n; n.v=s; return n; }
JNode jnum(double d){ JNode n; n.v=d; return n; }
JNode jbool(bool b){ JNode n; n.v=b; return n; }
JNode jnull(){ JNode n; n.v=JNull{}; return n; }
JNode jobj(JObject o){ JNode n; n.v=std::move(o); return n; }
JNode jarr(JArray a){ JNode n; n.v=std::move(a); return n; }

const JNode* json_get(const JNode& obj, const std::string& key){
    if(!json_is_object(obj)) return nullptr;
    const auto& m=std::get<JObject>(obj.v);
    auto it=m.find(key);
    return it==m.end() ? nullptr : &it->second;
}
bool json_get_string(const JNode& obj, const std::string& key, std::string& out){
    const JNode* n=json_get(obj,key);
    if(!n || !json_is_string(*n)) return false;
    out=std::get<std::string>(n->v); return true;
}
bool json_get_number(const JNode& obj, const std::string& key, double& out){
    const JNode* n=json_get(obj,key);
    if(!n || !std::holds_alternative<double>(n->v)) return false;
    out=std::get<double>(n->v); return true;
}
bool json_get_bool(const JNode& obj, const std::string& key, bool& out){
    const JNode* n=json_get(obj,key);
    if(!n || !std::holds_alternative<bool>(n->v)) return false;
    out=std::get<bool>(n->v); return true;
}
std::string json_string_or(const JNode& obj, const std::string& key, const std::string& def){
    std::string s; return json_get_string(obj,key,s) ? s : def;
}
}
