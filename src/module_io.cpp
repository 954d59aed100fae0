#include <tinyil/module_io.hpp>
#include <tinyil/resolver.hpp>
#include <tinyil/encoder.hpp>
#include <tinyil/error.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <fstream>

using json = nlohmann::json;

namespace tinyil
{

namespace
{

struct pending_type
{
  const json* description;
  type_def* def;
};

const json& list_of(const json& j, const char* key)
{
  static const json empty = json::array();
  auto it = j.find(key);
  return it == j.end() || it->is_null() ? empty : *it;
}

const type_def& find_definition(const module& mod, std::string_view name)
{
  if(auto* def = mod.find_type(name))
    return *def;

  for(auto& ref : mod.module_references)
  {
    auto* other = mod.resolver ? mod.resolver->resolve(ref) : nullptr;
    if(other == nullptr)
      fail(error_kind::unresolved_symbol, "Module '{}' references '{}', which is not loaded", mod.name, ref);

    if(auto* def = other->find_type(name))
      return *def;
  }
  fail(error_kind::unresolved_symbol, "Unable to locate type with name '{}' for module '{}'", name, mod.name);
}

type_ptr parse_type(const module& mod, std::string_view type_name, const type_def* owner, const method_def* method)
{
  const auto mods = strip_type_modifiers(type_name);
  const auto name = mods.element;

  type_ptr type;
  if(auto prim = find_primitive(name))
    type = make_primitive(*prim);
  else if(name.substr(0, 2) == "!!")
  {
    const generic_param* param = method ? find_generic(method->generic_parameters, name.substr(2)) : nullptr;
    if(param == nullptr)
      fail(error_kind::unresolved_symbol, "Unable to locate generic type with name '{}'", name.substr(2));
    type = make_generic(*param);
  }
  else if(name.front() == '!')
  {
    for(const type_def* decl = owner; decl != nullptr && !type; decl = decl->declaring_type)
    {
      if(auto* param = find_generic(decl->generic_parameters, name.substr(1)))
        type = make_generic(*param);
    }
    if(!type)
      fail(error_kind::unresolved_symbol, "Unable to locate generic type with name '{}'", name.substr(1));
  }
  else
    type = make_defined(find_definition(mod, name));

  return apply_type_modifiers(std::move(type), mods);
}

void declare_types(module& mod, const json& types, type_def* enclosing, std::vector<pending_type>& pending)
{
  for(auto& t : types)
  {
    auto& def = mod.add_type(t.value("namespace", std::string()), t.at("name").get<std::string>(), enclosing);
    for(auto& g : list_of(t, "generic_parameters"))
      def.add_generic_parameter(g.get<std::string>());

    pending.push_back(pending_type { &t, &def });
    declare_types(mod, list_of(t, "nested"), &def, pending);
  }
}

void define_members(const module& mod, const json& t, type_def& def)
{
  if(auto it = t.find("base"); it != t.end() && !it->is_null())
    def.base_type = parse_type(mod, it->get<std::string>(), &def, nullptr);

  for(auto& f : list_of(t, "fields"))
    def.add_field(f.at("name").get<std::string>(), parse_type(mod, f.at("type").get<std::string>(), &def, nullptr),
                  f.value("static", false));

  for(auto& m : list_of(t, "methods"))
  {
    auto& method = def.add_method(m.at("name").get<std::string>(), nullptr, !m.value("static", false));

    for(auto& g : list_of(m, "generic_parameters"))
    {
      const auto position = method.generic_parameters.size();
      method.generic_parameters.push_back(std::make_unique<generic_param>(generic_param { g.get<std::string>(), position }));
    }

    method.return_type = parse_type(mod, m.value("return", std::string("void")), &def, &method);

    for(auto& p : list_of(m, "parameters"))
      method.add_parameter(p.at("name").get<std::string>(), parse_type(mod, p.at("type").get<std::string>(), &def, &method));

    for(auto& a : list_of(m, "attributes"))
      method.attributes.push_back(custom_attribute { a.at("type").get<std::string>(), a.value("args", std::vector<std::string>()) });
  }
}

json write_method(const method_def& method, metadata_tokens& tokens)
{
  json m;
  m["name"] = method.name;
  m["static"] = !method.has_this;
  m["return"] = type_notation(method.return_type, &method);

  m["generic_parameters"] = json::array();
  for(auto& g : method.generic_parameters)
    m["generic_parameters"].push_back(g->name);

  m["parameters"] = json::array();
  for(auto& p : method.parameters)
    m["parameters"].push_back({ { "name", p->name }, { "type", type_notation(p->type, &method) } });

  m["attributes"] = json::array();
  for(auto& a : method.attributes)
    m["attributes"].push_back({ { "type", a.type_name }, { "args", a.args } });

  if(method.body.empty())
    return m;

  m["init_locals"] = method.body.init_locals;
  m["locals"] = json::array();
  for(auto& l : method.body.locals)
    m["locals"].push_back(type_notation(l.type, &method));

  m["listing"] = json::array();
  for(std::size_t i = 0; i < method.body.size(); ++i)
    m["listing"].push_back(format_instruction(method.body, i));

  std::string hex;
  for(auto byte : encode(method.body, method, tokens))
    hex += fmt::format("{:02X}", byte);
  m["bytecode"] = std::move(hex);

  return m;
}

json write_type(const type_def& def, metadata_tokens& tokens)
{
  json t;
  t["namespace"] = def.ns;
  t["name"] = def.name;
  if(def.base_type)
    t["base"] = type_notation(def.base_type);

  t["generic_parameters"] = json::array();
  for(auto& g : def.generic_parameters)
    t["generic_parameters"].push_back(g->name);

  t["fields"] = json::array();
  for(auto& f : def.fields)
    t["fields"].push_back({ { "name", f->name }, { "type", type_notation(f->type) }, { "static", f->is_static } });

  t["methods"] = json::array();
  for(auto& m : def.methods)
    t["methods"].push_back(write_method(*m, tokens));

  t["nested"] = json::array();
  for(auto* nested : def.nested_types)
    t["nested"].push_back(write_type(*nested, tokens));

  return t;
}

}

std::string type_notation(const type_ptr& type, const method_def* method)
{
  if(!type)
    return "void";

  switch(type->kind)
  {
  case type_kind::primitive:
    return std::string(primitive_name(type->prim));

  case type_kind::defined:
    return type->def->full_name();

  case type_kind::generic_parameter:
    {
      const bool on_method = method != nullptr
          && std::any_of(method->generic_parameters.begin(), method->generic_parameters.end(),
                         [&type](const auto& g) { return g.get() == type->generic; });
      return (on_method ? "!!" : "!") + type->generic->name;
    }

  case type_kind::pointer:
    return type_notation(type->element, method) + "*";

  case type_kind::pinned:
    return type_notation(type->element, method) + " pinned";
  }
  return "void";
}

module& read_module(const json& description, module_registry& registry)
{
  try
  {
    auto name = description.at("name").get<std::string>();
    if(registry.resolve(name) != nullptr)
      fail(error_kind::duplicate_definition, "Module '{}' is already loaded", name);

    auto& mod = registry.create(std::move(name));
    for(auto& ref : list_of(description, "references"))
      mod.add_module_reference(ref.get<std::string>());

    // every type is declared before any signature mentions it
    std::vector<pending_type> pending;
    declare_types(mod, list_of(description, "types"), nullptr, pending);
    for(auto& p : pending)
      define_members(mod, *p.description, *p.def);

    return mod;
  }
  catch(const json::exception& e)
  {
    fail(error_kind::syntax, "Malformed module description: {}", e.what());
  }
}

json parse_description(const std::filesystem::path& path)
{
  std::ifstream is(path);
  if(!is)
    fail(error_kind::unresolved_symbol, "Unable to open module description '{}'", path.string());

  try
  {
    return json::parse(is);
  }
  catch(const json::parse_error& e)
  {
    fail(error_kind::syntax, "Unable to parse '{}': {}", path.string(), e.what());
  }
}

module& load_module(const std::filesystem::path& path, module_registry& registry)
{
  return read_module(parse_description(path), registry);
}

json write_module(const module& mod)
{
  metadata_tokens tokens(mod);

  json j;
  j["name"] = mod.name;
  j["references"] = mod.module_references;
  j["imported"] = mod.imported_references;

  j["types"] = json::array();
  for(auto& def : mod.types)
  {
    if(def->declaring_type == nullptr)
      j["types"].push_back(write_type(*def, tokens));
  }
  return j;
}

}
