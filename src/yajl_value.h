#pragma once

#include <string.h>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <yajl/yajl_tree.h>
#include <yajl/yajl_gen.h>

inline std::shared_ptr<yajl_val_s> parse_json(const std::string& json)
{
    char errorbuf[1024];
    std::shared_ptr<yajl_val_s> tree(yajl_tree_parse(json.c_str(), errorbuf, sizeof(errorbuf)), yajl_tree_free);
    if (!tree) throw std::runtime_error(std::string("yajl_tree_parse() failed: ") + errorbuf);
    return tree;
}

template<typename T> T get(yajl_val val);

template<> inline std::string get<std::string>(yajl_val val)
{
    auto str = YAJL_GET_STRING(val);
    if (!str) throw std::runtime_error("Not a string(" + std::to_string(val->type) + ")");
    //else
    return str;
}

template<> inline int64_t get<int64_t>(yajl_val val)
{
    if (!YAJL_IS_INTEGER(val)) throw std::runtime_error("Not an integer");
    return YAJL_GET_INTEGER(val);
}

template<> inline std::map<std::string,yajl_val> get<std::map<std::string,yajl_val>>(yajl_val val)
{
    auto obj = YAJL_GET_OBJECT(val);
    if (!obj) throw std::runtime_error("Not a JSON object");
    //else
    std::map<std::string,yajl_val> m;
    for (int i = 0; i < obj->len; i++) {
        m[obj->keys[i]] = obj->values[i];
    }
    return m;
}

inline yajl_val get(yajl_val val, const std::string& propname)
{
    return get<std::map<std::string,yajl_val>>(val).at(propname);
}

// thin helpers over yajl_gen for building one JSON document
inline std::shared_ptr<yajl_gen_t> new_json_gen()
{
    std::shared_ptr<yajl_gen_t> gen(yajl_gen_alloc(NULL), yajl_gen_free);
    if (!gen) throw std::runtime_error("yajl_gen_alloc() failed");
    return gen;
}

inline void gen_string(yajl_gen gen, const std::string& str)
{
    yajl_gen_string(gen, (const unsigned char*)str.c_str(), str.length());
}

inline void gen_key_string(yajl_gen gen, const std::string& key, const std::string& value)
{
    gen_string(gen, key);
    gen_string(gen, value);
}

inline void gen_key_integer(yajl_gen gen, const std::string& key, int64_t value)
{
    gen_string(gen, key);
    yajl_gen_integer(gen, value);
}

inline void gen_key_bool(yajl_gen gen, const std::string& key, bool value)
{
    gen_string(gen, key);
    yajl_gen_bool(gen, value? 1 : 0);
}

inline std::string gen_to_string(yajl_gen gen)
{
    const unsigned char* buf;
    size_t len;
    if (yajl_gen_get_buf(gen, &buf, &len) != yajl_gen_status_ok) throw std::runtime_error("yajl_gen_get_buf() failed");
    return std::string((const char*)buf, len);
}
