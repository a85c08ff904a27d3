#include "layout_snapshot.hpp"

#include <algorithm>
#include <cstdlib>
#include <dockbridge/logger.hpp>
#include <map>
#include <sstream>
#include <unordered_set>

#include "bridge/monitor_clamp.hpp"

namespace dockbridge
{

// ─── Capture ─────────────────────────────────────────────────────────────────

static LayoutSnapshot::TreeState capture_tree(const DockTree& tree, const PaneRegistry& registry)
{
    LayoutSnapshot::TreeState state;
    state.root = tree.root();
    for (const auto& [id, tile] : tree.tiles())
    {
        LayoutSnapshot::TileState t;
        t.id       = id;
        t.kind     = tile.kind;
        t.children = tile.children;
        t.active   = tile.active;
        if (tile.is_pane())
        {
            // Panes without a stable id are written unresolvable and
            // dropped on restore.
            t.pane = registry.stable_id(tile.pane).value_or("");
        }
        state.tiles.push_back(std::move(t));
    }
    return state;
}

LayoutSnapshot capture_layout(const DockModel& model, const PaneRegistry& registry)
{
    LayoutSnapshot snapshot;
    snapshot.root = capture_tree(model.root_tree(), registry);

    for (const auto& [id, dock] : model.detached_docks())
    {
        snapshot.detached.push_back(
            {.viewport = id, .serial = dock.serial, .placement = dock.placement, .tree = capture_tree(dock.tree, registry)});
    }

    for (const auto& [viewport, fm] : model.floating_managers())
    {
        for (FloatingId fid : fm.z_order())
        {
            const FloatingWindow* w = fm.get(fid);
            snapshot.floating.push_back({.viewport  = viewport,
                                         .id        = fid,
                                         .offset    = w->offset,
                                         .size      = w->size,
                                         .collapsed = w->collapsed,
                                         .tree      = capture_tree(w->tree, registry)});
        }
    }

    snapshot.next_viewport = model.next_viewport_id();
    snapshot.next_serial   = model.next_serial();
    snapshot.next_floating = model.next_floating_id();
    return snapshot;
}

// ─── Restore ─────────────────────────────────────────────────────────────────

namespace
{

class TreeRebuilder
{
   public:
    TreeRebuilder(const LayoutSnapshot::TreeState& state, const PaneRegistry& registry, RestoreReport& report)
        : registry_(&registry), report_(&report)
    {
        for (const auto& t : state.tiles)
            by_id_.emplace(t.id, &t);
        if (state.root)
        {
            if (auto root = keep(*state.root))
                subtree_.root = *root;
        }
    }

    SubTree take() { return std::move(subtree_); }

   private:
    // Id of the tile that stands in for `id` after dropping unresolved panes.
    std::optional<TileId> keep(TileId id)
    {
        auto it = by_id_.find(id);
        if (it == by_id_.end() || !visited_.insert(id).second)
            return std::nullopt;

        const LayoutSnapshot::TileState& state = *it->second;
        if (state.kind == TileKind::Pane)
        {
            auto pane = registry_->resolve(state.pane);
            if (!pane)
            {
                ++report_->dropped_panes;
                DOCKBRIDGE_LOG_DEBUG(log_category::PERSIST, "pane '{}' no longer resolves; dropped", state.pane);
                return std::nullopt;
            }
            subtree_.tiles[id] = Tile{.kind = TileKind::Pane, .pane = *pane};
            return id;
        }

        std::vector<TileId> children;
        for (TileId child : state.children)
        {
            if (auto kept = keep(child))
                children.push_back(*kept);
        }
        if (children.empty())
            return std::nullopt;
        if (children.size() == 1 && state.kind != TileKind::Tabs)
            return children.front();

        // A same-direction child (left behind by a collapse) joins this split.
        if (state.kind != TileKind::Tabs)
        {
            std::vector<TileId> flat;
            for (TileId child : children)
            {
                auto ct = subtree_.tiles.find(child);
                if (ct != subtree_.tiles.end() && ct->second.kind == state.kind)
                {
                    flat.insert(flat.end(), ct->second.children.begin(), ct->second.children.end());
                    subtree_.tiles.erase(ct);
                }
                else
                {
                    flat.push_back(child);
                }
            }
            children = std::move(flat);
        }

        Tile tile{.kind = state.kind, .children = children};
        if (state.kind == TileKind::Tabs)
        {
            bool active_kept =
                std::find(children.begin(), children.end(), state.active) != children.end();
            tile.active = active_kept ? state.active : children.front();
        }
        subtree_.tiles[id] = std::move(tile);
        return id;
    }

    const PaneRegistry*                                      registry_;
    RestoreReport*                                           report_;
    std::map<TileId, const LayoutSnapshot::TileState*>       by_id_;
    std::unordered_set<TileId>                               visited_;
    SubTree                                                  subtree_;
};

}   // namespace

static DockTree rebuild_tree(const DockModel&                 model,
                             const LayoutSnapshot::TreeState& state,
                             const PaneRegistry&              registry,
                             RestoreReport&                   report)
{
    TreeRebuilder rebuilder(state, registry, report);
    SubTree       sub = rebuilder.take();
    if (sub.empty())
        return model.make_tree();
    return DockTree::from_subtree(std::move(sub), model.allocator());
}

RestoreReport restore_layout(DockModel&                              model,
                             const LayoutSnapshot&                   snapshot,
                             const PaneRegistry&                     registry,
                             const std::optional<std::vector<Rect>>& monitors)
{
    RestoreReport report;
    if (snapshot.version > LayoutSnapshot::FORMAT_VERSION)
    {
        DOCKBRIDGE_LOG_ERROR(log_category::PERSIST,
                             "layout version {} is newer than supported version {}",
                             snapshot.version,
                             LayoutSnapshot::FORMAT_VERSION);
        return report;
    }

    model.clear();
    model.replace_root(rebuild_tree(model, snapshot.root, registry, report));

    for (const auto& d : snapshot.detached)
    {
        DockTree tree = rebuild_tree(model, d.tree, registry, report);
        if (tree.is_empty())
        {
            ++report.dropped_windows;
            continue;
        }
        ViewportPlacement placement = d.placement;
        if (monitors && !monitors->empty())
        {
            Vec2 clamped = clamp_to_monitors(placement.position, placement.size, *monitors);
            if (!(clamped == placement.position))
            {
                placement.position = clamped;
                ++report.clamped_windows;
            }
        }
        if (!model.restore_detached(d.viewport, d.serial, std::move(tree), std::move(placement)))
            ++report.dropped_windows;
    }

    for (const auto& f : snapshot.floating)
    {
        DockTree tree = rebuild_tree(model, f.tree, registry, report);
        if (tree.is_empty()
            || !model.restore_floating(f.viewport, f.id, std::move(tree), f.offset, f.size, f.collapsed))
        {
            ++report.dropped_windows;
        }
    }

    model.set_counters(snapshot.next_viewport, snapshot.next_serial, snapshot.next_floating);

    DOCKBRIDGE_LOG_INFO(log_category::PERSIST,
                        "layout restored: {} detached viewports, {} panes and {} windows dropped",
                        model.detached_docks().size(),
                        report.dropped_panes,
                        report.dropped_windows);
    return report;
}

// ─── Simple JSON writer ──────────────────────────────────────────────────────

std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

static void write_tree(std::ostringstream& os, const LayoutSnapshot::TreeState& tree)
{
    os << "{\"root\": ";
    if (tree.root)
        os << *tree.root;
    else
        os << "null";
    os << ", \"tiles\": [";
    for (size_t i = 0; i < tree.tiles.size(); ++i)
    {
        const auto& t = tree.tiles[i];
        os << (i ? ", " : "") << "{\"id\": " << t.id << ", \"kind\": \"" << tile_kind_name(t.kind) << "\"";
        if (t.kind == TileKind::Pane)
        {
            os << ", \"pane\": \"" << escape_json(t.pane) << "\"";
        }
        else
        {
            os << ", \"children\": [";
            for (size_t c = 0; c < t.children.size(); ++c)
                os << (c ? ", " : "") << t.children[c];
            os << "]";
            if (t.kind == TileKind::Tabs)
                os << ", \"active\": " << t.active;
        }
        os << "}";
    }
    os << "]}";
}

std::string serialize_json(const LayoutSnapshot& snapshot)
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << snapshot.version << ",\n";
    os << "  \"next_viewport\": " << snapshot.next_viewport << ",\n";
    os << "  \"next_serial\": " << snapshot.next_serial << ",\n";
    os << "  \"next_floating\": " << snapshot.next_floating << ",\n";
    os << "  \"root_tree\": ";
    write_tree(os, snapshot.root);
    os << ",\n";

    os << "  \"detached_viewports\": [";
    for (size_t i = 0; i < snapshot.detached.size(); ++i)
    {
        const auto& d = snapshot.detached[i];
        const auto& p = d.placement;
        os << (i ? ",\n" : "\n") << "    {\"viewport\": " << d.viewport << ", \"serial\": " << d.serial
           << ", \"pos_x\": " << p.position.x << ", \"pos_y\": " << p.position.y
           << ", \"width\": " << p.size.x << ", \"height\": " << p.size.y << ", \"title\": \""
           << escape_json(p.title) << "\", \"decoration\": " << static_cast<int>(p.decoration)
           << ", \"maximized\": " << (p.maximized ? "true" : "false")
           << ", \"fullscreen\": " << (p.fullscreen ? "true" : "false") << ", \"tree\": ";
        write_tree(os, d.tree);
        os << "}";
    }
    os << (snapshot.detached.empty() ? "" : "\n  ") << "],\n";

    os << "  \"floating_windows\": [";
    for (size_t i = 0; i < snapshot.floating.size(); ++i)
    {
        const auto& f = snapshot.floating[i];
        os << (i ? ",\n" : "\n") << "    {\"viewport\": " << f.viewport << ", \"window_id\": " << f.id
           << ", \"offset_x\": " << f.offset.x << ", \"offset_y\": " << f.offset.y
           << ", \"width\": " << f.size.x << ", \"height\": " << f.size.y
           << ", \"collapsed\": " << (f.collapsed ? "true" : "false") << ", \"tree\": ";
        write_tree(os, f.tree);
        os << "}";
    }
    os << (snapshot.floating.empty() ? "" : "\n  ") << "]\n";
    os << "}\n";
    return os.str();
}

// ─── Simple JSON reader ──────────────────────────────────────────────────────
// Enough for the format above: keys are looked up in the object text they
// belong to, nested objects and arrays are cut out first.

// Index just past the string starting at `pos` (which holds the opening quote).
static size_t skip_string(const std::string& json, size_t pos)
{
    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        if (json[i] == '\\')
            ++i;
        else if (json[i] == '"')
            return i + 1;
    }
    return json.size();
}

static size_t skip_space(const std::string& json, size_t pos)
{
    while (pos < json.size() && (json[pos] == ' ' || json[pos] == '\t' || json[pos] == '\n' || json[pos] == '\r'))
        ++pos;
    return pos;
}

// Position of the value for `key` in the top level of `json` (an object).
static size_t find_value(const std::string& json, const std::string& key)
{
    const std::string search = "\"" + key + "\"";
    int               depth  = 0;
    for (size_t i = 0; i < json.size();)
    {
        char c = json[i];
        if (c == '"')
        {
            if (depth == 1 && json.compare(i, search.size(), search) == 0)
            {
                // Only a key is followed by a colon.
                size_t v = skip_space(json, i + search.size());
                if (v < json.size() && json[v] == ':')
                    return skip_space(json, v + 1);
            }
            i = skip_string(json, i);
            continue;
        }
        if (c == '{' || c == '[')
            ++depth;
        else if (c == '}' || c == ']')
            --depth;
        ++i;
    }
    return std::string::npos;
}

// Text of the balanced object or array starting at `pos`.
static std::string balanced_at(const std::string& json, size_t pos)
{
    if (pos >= json.size() || (json[pos] != '{' && json[pos] != '['))
        return {};
    int depth = 0;
    for (size_t i = pos; i < json.size();)
    {
        char c = json[i];
        if (c == '"')
        {
            i = skip_string(json, i);
            continue;
        }
        if (c == '{' || c == '[')
            ++depth;
        else if (c == '}' || c == ']')
        {
            if (--depth == 0)
                return json.substr(pos, i - pos + 1);
        }
        ++i;
    }
    return {};
}

static std::optional<double> read_number_value(const std::string& json, const std::string& key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    const char* begin = json.c_str() + pos;
    char*       end   = nullptr;
    double      value = std::strtod(begin, &end);
    if (end == begin)
        return std::nullopt;
    return value;
}

static bool read_bool_value(const std::string& json, const std::string& key, bool default_val)
{
    size_t pos = find_value(json, key);
    if (pos == std::string::npos)
        return default_val;
    if (json.compare(pos, 4, "true") == 0)
        return true;
    if (json.compare(pos, 5, "false") == 0)
        return false;
    return default_val;
}

static std::string read_string_value(const std::string& json, const std::string& key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string::npos || json[pos] != '"')
        return "";
    std::string out;
    for (size_t i = pos + 1; i < json.size() && json[i] != '"'; ++i)
    {
        if (json[i] == '\\' && i + 1 < json.size())
        {
            char e = json[++i];
            out += e == 'n' ? '\n' : e == 'r' ? '\r' : e == 't' ? '\t' : e;
        }
        else
        {
            out += json[i];
        }
    }
    return out;
}

static std::string read_object_value(const std::string& json, const std::string& key)
{
    size_t pos = find_value(json, key);
    return pos == std::string::npos ? std::string() : balanced_at(json, pos);
}

// Objects of the array stored under `key`.
static std::vector<std::string> parse_json_array(const std::string& json, const std::string& key)
{
    std::vector<std::string> objects;
    std::string              array = read_object_value(json, key);
    for (size_t i = 1; i + 1 < array.size();)
    {
        if (array[i] == '{')
        {
            std::string obj = balanced_at(array, i);
            if (obj.empty())
                break;
            i += obj.size();
            objects.push_back(std::move(obj));
            continue;
        }
        ++i;
    }
    return objects;
}

static std::vector<uint64_t> parse_id_array(const std::string& json, const std::string& key)
{
    std::vector<uint64_t> ids;
    std::string           array = read_object_value(json, key);
    const char*           p     = array.c_str();
    while (*p)
    {
        if (*p >= '0' && *p <= '9')
        {
            char* end = nullptr;
            ids.push_back(std::strtoull(p, &end, 10));
            p = end;
            continue;
        }
        ++p;
    }
    return ids;
}

static std::optional<TileKind> parse_tile_kind(const std::string& name)
{
    for (TileKind kind : {TileKind::Pane, TileKind::Tabs, TileKind::Horizontal, TileKind::Vertical})
    {
        if (name == tile_kind_name(kind))
            return kind;
    }
    return std::nullopt;
}

static bool read_tree(const std::string& json, LayoutSnapshot::TreeState& tree)
{
    if (json.empty())
        return false;
    if (auto root = read_number_value(json, "root"))
        tree.root = static_cast<TileId>(*root);
    for (const auto& obj : parse_json_array(json, "tiles"))
    {
        LayoutSnapshot::TileState t;
        auto                      id   = read_number_value(obj, "id");
        auto                      kind = parse_tile_kind(read_string_value(obj, "kind"));
        if (!id || !kind)
            return false;
        t.id   = static_cast<TileId>(*id);
        t.kind = *kind;
        if (t.kind == TileKind::Pane)
            t.pane = read_string_value(obj, "pane");
        else
            t.children = parse_id_array(obj, "children");
        if (auto active = read_number_value(obj, "active"))
            t.active = static_cast<TileId>(*active);
        tree.tiles.push_back(std::move(t));
    }
    return true;
}

bool deserialize_json(const std::string& json, LayoutSnapshot& snapshot)
{
    auto version = read_number_value(json, "version");
    if (!version)
        return false;
    snapshot.version = static_cast<uint32_t>(*version);
    if (snapshot.version > LayoutSnapshot::FORMAT_VERSION)
    {
        DOCKBRIDGE_LOG_WARN(log_category::PERSIST, "layout version {} not supported", snapshot.version);
        return false;
    }

    snapshot.next_viewport = static_cast<ViewportId>(read_number_value(json, "next_viewport").value_or(1));
    snapshot.next_serial   = static_cast<uint64_t>(read_number_value(json, "next_serial").value_or(1));
    snapshot.next_floating = static_cast<FloatingId>(read_number_value(json, "next_floating").value_or(1));

    snapshot.root = {};
    if (!read_tree(read_object_value(json, "root_tree"), snapshot.root))
        return false;

    snapshot.detached.clear();
    for (const auto& obj : parse_json_array(json, "detached_viewports"))
    {
        LayoutSnapshot::DetachedState d;
        d.viewport                   = static_cast<ViewportId>(read_number_value(obj, "viewport").value_or(0));
        d.serial                     = static_cast<uint64_t>(read_number_value(obj, "serial").value_or(0));
        d.placement.position.x       = static_cast<float>(read_number_value(obj, "pos_x").value_or(0.0));
        d.placement.position.y       = static_cast<float>(read_number_value(obj, "pos_y").value_or(0.0));
        d.placement.size.x           = static_cast<float>(read_number_value(obj, "width").value_or(0.0));
        d.placement.size.y           = static_cast<float>(read_number_value(obj, "height").value_or(0.0));
        d.placement.title            = read_string_value(obj, "title");
        d.placement.decoration       = read_number_value(obj, "decoration").value_or(0) != 0
                                           ? DecorationMode::ClientSideChrome
                                           : DecorationMode::OsDecorated;
        d.placement.maximized        = read_bool_value(obj, "maximized", false);
        d.placement.fullscreen       = read_bool_value(obj, "fullscreen", false);
        if (d.viewport == ROOT_VIEWPORT_ID || !read_tree(read_object_value(obj, "tree"), d.tree))
            return false;
        snapshot.detached.push_back(std::move(d));
    }

    snapshot.floating.clear();
    for (const auto& obj : parse_json_array(json, "floating_windows"))
    {
        LayoutSnapshot::FloatingState f;
        f.viewport  = static_cast<ViewportId>(read_number_value(obj, "viewport").value_or(0));
        f.id        = static_cast<FloatingId>(read_number_value(obj, "window_id").value_or(0));
        f.offset.x  = static_cast<float>(read_number_value(obj, "offset_x").value_or(0.0));
        f.offset.y  = static_cast<float>(read_number_value(obj, "offset_y").value_or(0.0));
        f.size.x    = static_cast<float>(read_number_value(obj, "width").value_or(0.0));
        f.size.y    = static_cast<float>(read_number_value(obj, "height").value_or(0.0));
        f.collapsed = read_bool_value(obj, "collapsed", false);
        if (!read_tree(read_object_value(obj, "tree"), f.tree))
            return false;
        snapshot.floating.push_back(std::move(f));
    }
    return true;
}

}   // namespace dockbridge
