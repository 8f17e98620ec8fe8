#include "CompositionGraph.h"

QString GraphNode::param(const QString& key) const {
    for (const auto& p : params) {
        if (p.key == key) return p.value;
    }
    return QString();
}

bool GraphNode::operator==(const GraphNode& other) const {
    return id == other.id && kind == other.kind && stream == other.stream &&
           inputs == other.inputs && params == other.params &&
           sourcePath == other.sourcePath;
}

NodeId CompositionGraph::append(GraphNode node) {
    node.id = static_cast<NodeId>(m_nodes.size());
    m_nodes.push_back(std::move(node));
    return m_nodes.back().id;
}

NodeId CompositionGraph::addInput(const QString& path, StreamType stream) {
    GraphNode n;
    n.kind = NodeKind::Input;
    n.stream = stream;
    n.sourcePath = path;
    return append(std::move(n));
}

NodeId CompositionGraph::addFilter(NodeKind kind, StreamType stream,
                                   const std::vector<NodeId>& inputs,
                                   const std::vector<NodeParam>& params) {
    GraphNode n;
    n.kind = kind;
    n.stream = stream;
    n.inputs = inputs;
    n.params = params;
    return append(std::move(n));
}

NodeId CompositionGraph::addOutput(NodeId video, NodeId audio) {
    GraphNode n;
    n.kind = NodeKind::Output;
    n.stream = StreamType::Muxed;
    n.inputs = {video, audio};
    return append(std::move(n));
}

const GraphNode* CompositionGraph::node(NodeId id) const {
    if (id >= 0 && id < static_cast<int>(m_nodes.size())) {
        return &m_nodes[id];
    }
    return nullptr;
}

int CompositionGraph::countOf(NodeKind kind) const {
    int count = 0;
    for (const auto& n : m_nodes) {
        if (n.kind == kind) ++count;
    }
    return count;
}

std::vector<NodeId> CompositionGraph::nodesOf(NodeKind kind) const {
    std::vector<NodeId> ids;
    for (const auto& n : m_nodes) {
        if (n.kind == kind) ids.push_back(n.id);
    }
    return ids;
}

bool CompositionGraph::validate(QString* error) const {
    auto setError = [error](const QString& msg) {
        if (error) *error = msg;
        return false;
    };

    std::vector<int> consumers(m_nodes.size(), 0);
    bool hasOutput = false;

    for (const auto& n : m_nodes) {
        if (n.kind == NodeKind::Input) {
            if (!n.inputs.empty())
                return setError(QString("Input node %1 has inputs").arg(n.id));
            if (n.sourcePath.isEmpty())
                return setError(QString("Input node %1 has no source").arg(n.id));
            continue;
        }
        if (n.inputs.empty())
            return setError(QString("Node %1 has no inputs").arg(n.id));

        for (size_t slot = 0; slot < n.inputs.size(); ++slot) {
            NodeId in = n.inputs[slot];
            // Inputs always precede their consumer, which also rules out cycles
            if (in < 0 || in >= n.id)
                return setError(QString("Node %1 references invalid node %2").arg(n.id).arg(in));
            if (++consumers[in] > 1)
                return setError(QString("Node %1 is consumed more than once").arg(in));

            const GraphNode& src = m_nodes[in];
            if (src.kind == NodeKind::Output)
                return setError(QString("Output node %1 used as input").arg(in));

            StreamType expected = n.stream;
            if (n.kind == NodeKind::Output)
                expected = (slot == 0) ? StreamType::Video : StreamType::Audio;
            if (src.stream != expected)
                return setError(QString("Node %1 input %2 has the wrong stream type").arg(n.id).arg(in));
        }
        if (n.kind == NodeKind::Output) {
            if (n.inputs.size() != 2)
                return setError(QString("Output node %1 needs a video and an audio input").arg(n.id));
            hasOutput = true;
        }
    }

    if (!hasOutput)
        return setError("Graph has no output");

    for (const auto& n : m_nodes) {
        if (n.kind != NodeKind::Output && consumers[n.id] == 0)
            return setError(QString("Node %1 is never consumed").arg(n.id));
    }
    return true;
}

QString CompositionGraph::filterName(NodeKind kind) {
    switch (kind) {
        case NodeKind::Input:       return QString();
        case NodeKind::Crop:        return "crop";
        case NodeKind::Scale:       return "scale";
        case NodeKind::Overlay:     return "overlay";
        case NodeKind::ColorMix:    return "colorchannelmixer";
        case NodeKind::DrawText:    return "drawtext";
        case NodeKind::Volume:      return "volume";
        case NodeKind::ConcatAudio: return "concat";
        case NodeKind::MixAudio:    return "amix";
        case NodeKind::Output:      return QString();
    }
    return QString();
}

QString CompositionGraph::formatNumber(double value) {
    return QString::number(value, 'g', 12);
}

QString CompositionGraph::escapeChars(const QString& text, const QString& chars) {
    QString out;
    out.reserve(text.size() * 2);
    for (const QChar c : text) {
        if (chars.contains(c)) out += QLatin1Char('\\');
        out += c;
    }
    return out;
}

QString CompositionGraph::streamLabel(NodeId id) const {
    const GraphNode& n = m_nodes[id];
    if (n.kind == NodeKind::Input) {
        int inputIndex = 0;
        for (NodeId i = 0; i < id; ++i) {
            if (m_nodes[i].kind == NodeKind::Input) ++inputIndex;
        }
        return QString("%1:%2").arg(inputIndex).arg(n.stream == StreamType::Audio ? "a" : "v");
    }
    return QString("s%1").arg(id);
}

// Two escaping levels: option values, then the filter description itself
QString CompositionGraph::filterSpec(const GraphNode& node) const {
    QStringList parts;
    for (const auto& p : node.params) {
        const QString value = escapeChars(p.value, "\\'=:");
        parts << (p.key.isEmpty() ? value : p.key + "=" + value);
    }

    QString spec = filterName(node.kind);
    if (!parts.isEmpty()) {
        spec += "=" + parts.join(':');
    }
    return escapeChars(spec, "\\'[],;");
}

QStringList CompositionGraph::inputArguments() const {
    QStringList args;
    for (const auto& n : m_nodes) {
        if (n.kind == NodeKind::Input) {
            args << "-i" << n.sourcePath;
        }
    }
    return args;
}

QString CompositionGraph::filterComplex() const {
    QStringList chains;
    for (const auto& n : m_nodes) {
        if (n.kind == NodeKind::Input || n.kind == NodeKind::Output) continue;

        QString chain;
        for (NodeId in : n.inputs) {
            chain += "[" + streamLabel(in) + "]";
        }
        chain += filterSpec(n);
        chain += "[" + streamLabel(n.id) + "]";
        chains << chain;
    }
    return chains.join(';');
}

QStringList CompositionGraph::mapArguments() const {
    QStringList args;
    for (const auto& n : m_nodes) {
        if (n.kind != NodeKind::Output) continue;
        for (NodeId in : n.inputs) {
            const GraphNode& src = m_nodes[in];
            args << "-map"
                 << (src.kind == NodeKind::Input ? streamLabel(in) : "[" + streamLabel(in) + "]");
        }
    }
    return args;
}
