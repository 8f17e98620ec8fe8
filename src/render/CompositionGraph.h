#pragma once

#include <QString>
#include <QStringList>
#include <vector>

enum class NodeKind {
    Input,
    Crop,
    Scale,
    Overlay,
    ColorMix,
    DrawText,
    Volume,
    ConcatAudio,
    MixAudio,
    Output
};

enum class StreamType {
    Video,
    Audio,
    Muxed   // Output nodes: one video + one audio stream
};

using NodeId = int;
inline constexpr NodeId InvalidNode = -1;

// Filter option; an empty key makes it positional ("crop=iw:ih")
struct NodeParam {
    QString key;
    QString value;

    bool operator==(const NodeParam& other) const {
        return key == other.key && value == other.value;
    }
};

struct GraphNode {
    NodeId id = InvalidNode;
    NodeKind kind = NodeKind::Input;
    StreamType stream = StreamType::Video;
    std::vector<NodeId> inputs;
    std::vector<NodeParam> params;
    QString sourcePath;     // Input nodes only

    QString param(const QString& key) const;
    bool operator==(const GraphNode& other) const;
};

// Arena of filter nodes referencing their inputs by id. Every node feeds at
// most one consumer, so the graph is a tree rooted at the Output nodes.
// Serializes to the ffmpeg command line: one "-i" per Input node in creation
// order, a -filter_complex script and one "-map" per Output stream.
class CompositionGraph {
public:
    NodeId addInput(const QString& path, StreamType stream);
    NodeId addFilter(NodeKind kind, StreamType stream,
                     const std::vector<NodeId>& inputs,
                     const std::vector<NodeParam>& params = {});
    NodeId addOutput(NodeId video, NodeId audio);

    void clear() { m_nodes.clear(); }
    int nodeCount() const { return static_cast<int>(m_nodes.size()); }
    const std::vector<GraphNode>& nodes() const { return m_nodes; }
    const GraphNode* node(NodeId id) const;

    int countOf(NodeKind kind) const;
    std::vector<NodeId> nodesOf(NodeKind kind) const;

    bool validate(QString* error = nullptr) const;

    QStringList inputArguments() const;
    QString filterComplex() const;
    QStringList mapArguments() const;

    bool operator==(const CompositionGraph& other) const { return m_nodes == other.m_nodes; }
    bool operator!=(const CompositionGraph& other) const { return !(*this == other); }

    static QString filterName(NodeKind kind);
    static QString formatNumber(double value);
    static QString escapeChars(const QString& text, const QString& chars);

private:
    NodeId append(GraphNode node);
    QString streamLabel(NodeId id) const;
    QString filterSpec(const GraphNode& node) const;

    std::vector<GraphNode> m_nodes;
};
