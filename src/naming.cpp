#include "naming.h"

namespace rfx {

// ── Display-name parser ────────────────────────────────────────────────
//
// Every structural fact about a rack/chain/device is encoded in the host
// display name, since the host keeps nothing else for us:
//
//   "_R2_M"                      → mixer of rack 2
//   "R1: Rack"                   → rack 1
//   "R1_C3" / "R1_C3: Drums"     → chain 3 of rack 1
//   "R1_C3_D2: ReaComp"          → device 2 of that chain
//   "D4: ReaEQ"                  → standalone device 4
//   "D4_FX: ReaEQ", "D4_Util"    → device sub-parts
//   "R1_C3_D2_M1: LFO"           → modulator 1 of a device
//
// Grammar (longest structural prefix first):
//
//   name      = mixer | rackName | deviceRef
//   mixer     = "_R" index "_M" END
//   rackName  = "R" index ( "_C" index chainTail | ": " label )
//   chainTail = END | ": " label | "_D" index deviceTail
//   deviceRef = "D" index deviceTail
//   deviceTail= "_Util" END
//             | "_FX: " label
//             | "_M" index ": " label
//             | ": " label
//   index     = [1-9][0-9]*          -- no leading zeros, no sign
//   label     = any text, may contain ':'
//
// Matching is case-sensitive and never trims. Anything that stops short of
// a complete production is not a match.

class NameParser {
public:
    explicit NameParser(const QString& input) : m_input(input) {}

    ParsedName parse() {
        ParsedName r;
        if (atEnd())
            return r;

        QChar c = peek();
        if (c == '_') {
            if (!parseMixer(r)) return {};
        } else if (c == 'R') {
            if (!parseRack(r)) return {};
        } else if (c == 'D') {
            advance();
            if (!parseIndex(r.path.device)) return {};
            if (!parseDeviceTail(r)) return {};
        } else {
            return {};
        }
        return r;
    }

private:
    static constexpr int kMaxIndexDigits = 9;

    const QString& m_input;
    int m_pos = 0;

    // ── Helpers ──

    bool atEnd() const { return m_pos >= m_input.size(); }

    QChar peek() const { return atEnd() ? QChar('\0') : m_input[m_pos]; }

    void advance() { m_pos++; }

    bool lookingAt(const char* lit) const {
        return QStringView(m_input).mid(m_pos).startsWith(QLatin1String(lit));
    }

    bool consume(const char* lit) {
        if (!lookingAt(lit))
            return false;
        m_pos += QLatin1String(lit).size();
        return true;
    }

    static bool isAsciiDigit(QChar ch) { return ch >= '0' && ch <= '9'; }

    bool parseIndex(int& out) {
        if (atEnd() || !isAsciiDigit(peek()) || peek() == '0')
            return false;
        int value = 0;
        int digits = 0;
        while (!atEnd() && isAsciiDigit(peek())) {
            if (++digits > kMaxIndexDigits)
                return false;
            value = value * 10 + (peek().unicode() - '0');
            advance();
        }
        out = value;
        return true;
    }

    bool parseLabel(ParsedName& r) {
        if (!consume(": "))
            return false;
        r.label = m_input.mid(m_pos);
        r.hasLabel = true;
        m_pos = m_input.size();
        return true;
    }

    // ── Productions ──

    // mixer = "_R" index "_M" END
    bool parseMixer(ParsedName& r) {
        if (!consume("_R")) return false;
        if (!parseIndex(r.path.rack)) return false;
        if (!consume("_M")) return false;
        if (!atEnd()) return false;
        r.role = NameRole::Mixer;
        return true;
    }

    // rackName = "R" index ( "_C" index chainTail | ": " label )
    bool parseRack(ParsedName& r) {
        advance();
        if (!parseIndex(r.path.rack)) return false;

        if (consume("_C")) {
            if (!parseIndex(r.path.chain)) return false;
            if (atEnd()) {
                r.role = NameRole::Chain;
                return true;
            }
            if (consume("_D")) {
                if (!parseIndex(r.path.device)) return false;
                return parseDeviceTail(r);
            }
            if (!parseLabel(r)) return false;
            r.role = NameRole::Chain;
            return true;
        }

        if (!parseLabel(r)) return false;
        r.role = NameRole::Rack;
        return true;
    }

    bool parseDeviceTail(ParsedName& r) {
        if (consume("_Util")) {
            if (!atEnd()) return false;
            r.role = NameRole::DeviceUtil;
            return true;
        }
        if (consume("_FX")) {
            if (!parseLabel(r)) return false;
            r.role = NameRole::DeviceFx;
            return true;
        }
        if (consume("_M")) {
            if (!parseIndex(r.modulator)) return false;
            if (!parseLabel(r)) return false;
            r.role = NameRole::Modulator;
            return true;
        }
        if (!parseLabel(r)) return false;
        r.role = NameRole::Device;
        return true;
    }
};

namespace naming {

ParsedName parse(const QString& name) {
    NameParser parser(name);
    return parser.parse();
}

static QString devicePrefix(const HierarchyPath& p) {
    if (p.rack > 0)
        return QStringLiteral("R%1_C%2_D%3").arg(p.rack).arg(p.chain).arg(p.device);
    return QStringLiteral("D%1").arg(p.device);
}

static bool fitsDevice(const HierarchyPath& p) {
    if (p.device <= 0) return false;
    if (p.rack == 0) return p.chain == 0;
    return p.rack > 0 && p.chain > 0;
}

QString encode(const HierarchyPath& path, NameRole role, const QString& label, int modulator) {
    switch (role) {
    case NameRole::Rack:
        if (path.rack <= 0 || path.chain != 0 || path.device != 0) return {};
        return QStringLiteral("R%1: %2").arg(path.rack).arg(label);
    case NameRole::Chain:
        if (path.rack <= 0 || path.chain <= 0 || path.device != 0) return {};
        if (label.isEmpty())
            return QStringLiteral("R%1_C%2").arg(path.rack).arg(path.chain);
        return QStringLiteral("R%1_C%2: %3").arg(path.rack).arg(path.chain).arg(label);
    case NameRole::Device:
        if (!fitsDevice(path)) return {};
        return devicePrefix(path) + QStringLiteral(": ") + label;
    case NameRole::DeviceFx:
        if (!fitsDevice(path)) return {};
        return devicePrefix(path) + QStringLiteral("_FX: ") + label;
    case NameRole::DeviceUtil:
        if (!fitsDevice(path)) return {};
        return devicePrefix(path) + QStringLiteral("_Util");
    case NameRole::Modulator:
        if (!fitsDevice(path) || modulator <= 0) return {};
        return devicePrefix(path) + QStringLiteral("_M%1: ").arg(modulator) + label;
    case NameRole::Mixer:
        if (path.rack <= 0 || path.chain != 0 || path.device != 0) return {};
        return QStringLiteral("_R%1_M").arg(path.rack);
    case NameRole::None:
        break;
    }
    return {};
}

QString encode(const HierarchyPath& path, NodeKind kind, const QString& label) {
    switch (kind) {
    case NodeKind::Rack:   return encode(path, NameRole::Rack, label);
    case NodeKind::Chain:  return encode(path, NameRole::Chain, label);
    case NodeKind::Device: return encode(path, NameRole::Device, label);
    case NodeKind::Mixer:  return encode(path, NameRole::Mixer, label);
    case NodeKind::Plain:  break;
    }
    return {};
}

std::optional<HierarchyPath> decode(const QString& name) {
    ParsedName p = parse(name);
    if (!p.ok())
        return std::nullopt;
    return p.path;
}

NameRole roleOf(const QString& name) {
    return parse(name).role;
}

NodeKind classify(const QString& name) {
    switch (roleOf(name)) {
    case NameRole::Rack:   return NodeKind::Rack;
    case NameRole::Chain:  return NodeKind::Chain;
    case NameRole::Device: return NodeKind::Device;
    case NameRole::Mixer:  return NodeKind::Mixer;
    default:               return NodeKind::Plain;
    }
}

bool isRackName(const QString& name)   { return roleOf(name) == NameRole::Rack; }
bool isChainName(const QString& name)  { return roleOf(name) == NameRole::Chain; }
bool isDeviceName(const QString& name) { return roleOf(name) == NameRole::Device; }
bool isMixerName(const QString& name)  { return roleOf(name) == NameRole::Mixer; }

bool isSubPartName(const QString& name) {
    NameRole r = roleOf(name);
    return r == NameRole::DeviceFx || r == NameRole::DeviceUtil || r == NameRole::Modulator;
}

int rackIndexOf(const QString& name) {
    ParsedName p = parse(name);
    return p.role == NameRole::Rack ? p.path.rack : 0;
}

int chainIndexOf(const QString& name) {
    ParsedName p = parse(name);
    return p.role == NameRole::Chain ? p.path.chain : 0;
}

int deviceIndexOf(const QString& name) {
    ParsedName p = parse(name);
    return p.role == NameRole::Device ? p.path.device : 0;
}

int modulatorIndexOf(const QString& name) {
    ParsedName p = parse(name);
    return p.role == NameRole::Modulator ? p.modulator : 0;
}

int nextFreeIndex(const QStringList& names,
                  const std::function<int(const QString&)>& extractor) {
    int maxIdx = 0;
    for (const QString& n : names) {
        int idx = extractor(n);
        if (idx > maxIdx) maxIdx = idx;
    }
    return maxIdx + 1;
}

QString shortPluginName(const QString& fullName) {
    static const char* const kTypePrefixes[] = {
        "VST3i: ", "VST3: ", "VSTi: ", "VST: ",
        "AUi: ", "AU: ",
        "CLAPi: ", "CLAP: ",
        "JS: ",
    };

    QString s = fullName;
    for (const char* prefix : kTypePrefixes) {
        if (s.startsWith(QLatin1String(prefix))) {
            s = s.mid(QLatin1String(prefix).size());
            break;
        }
    }

    int slash = s.lastIndexOf('/');
    if (slash >= 0)
        s = s.mid(slash + 1);

    // trailing " (Manufacturer)"
    if (s.endsWith(')')) {
        int open = s.lastIndexOf(QStringLiteral(" ("));
        if (open > 0)
            s = s.left(open);
    }

    s = s.trimmed();
    return s.isEmpty() ? fullName : s;
}

QString displayLabel(const QString& name) {
    ParsedName p = parse(name);
    if (!p.ok())
        return shortPluginName(name);
    if (p.hasLabel && !p.label.isEmpty())
        return p.label;
    return name;
}

QString withPath(const QString& name, const HierarchyPath& path) {
    ParsedName p = parse(name);
    if (!p.ok())
        return name;
    QString out = encode(path, p.role, p.label, p.modulator);
    return out.isEmpty() ? name : out;
}

} // namespace naming
} // namespace rfx
