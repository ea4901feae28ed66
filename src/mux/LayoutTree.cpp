#include "LayoutTree.hpp"

namespace pmx {
std::atomic<PaneId> PaneIdGenerator::counter(0);

LayoutNodePtr LayoutNode::makePane(const Pane& pane) {
  if (pane.id <= 0) {
    STFATAL << "Tried to create a pane node without an id";
  }
  shared_ptr<LayoutNode> node(new LayoutNode());
  node->leaf = true;
  node->pane = pane;
  return node;
}

LayoutNodePtr LayoutNode::makeSplit(SplitDirection direction,
                                    vector<LayoutNodePtr> children) {
  if (children.size() < 2) {
    STFATAL << "A split needs at least two children, got " << children.size();
  }
  shared_ptr<LayoutNode> node(new LayoutNode());
  node->direction = direction;
  node->children = std::move(children);
  return node;
}

LayoutNodePtr LayoutTree::makeNewPane(
    const optional<string>& startupDirectory) {
  Pane pane(PaneIdGenerator::next());
  if (startupDirectory && !startupDirectory->empty()) {
    pane.startupDirectory = startupDirectory;
  }
  return LayoutNode::makePane(pane);
}

LayoutNodePtr LayoutTree::createSinglePane(
    const optional<string>& startupDirectory) {
  return makeNewPane(startupDirectory);
}

SplitResult LayoutTree::split(const LayoutNodePtr& root, PaneId targetId,
                              SplitDirection direction,
                              const optional<string>& startupDirectory,
                              int maxSameDirectionPanes) {
  SplitResult result;
  result.root = root;
  if (!root) {
    return result;
  }
  result.root = splitNode(root, targetId, direction, startupDirectory,
                          maxSameDirectionPanes, &result.newPaneId);
  if (!result.newPaneId) {
    VLOG(1) << "Split of " << paneIdToString(targetId) << " was a no-op";
  }
  return result;
}

LayoutNodePtr LayoutTree::splitNode(const LayoutNodePtr& node, PaneId targetId,
                                    SplitDirection direction,
                                    const optional<string>& startupDirectory,
                                    int maxSameDirectionPanes,
                                    optional<PaneId>* newPaneId) {
  if (node->isPane()) {
    if (node->getPane().id != targetId) {
      return node;
    }
    // A root pane or a pane inside a perpendicular split: nest a new split
    auto newPane = makeNewPane(startupDirectory);
    *newPaneId = newPane->getPane().id;
    return LayoutNode::makeSplit(direction, {node, newPane});
  }

  const vector<LayoutNodePtr>& children = node->getChildren();
  if (node->getDirection() == direction) {
    for (size_t a = 0; a < children.size(); a++) {
      const LayoutNodePtr& child = children[a];
      if (!child->isPane() || child->getPane().id != targetId) {
        continue;
      }
      if (int(children.size()) >= maxSameDirectionPanes) {
        LOG(INFO) << "Split limit of " << maxSameDirectionPanes
                  << " reached next to " << paneIdToString(targetId);
        return node;
      }
      // Continue the existing split rather than nesting a new one
      auto newPane = makeNewPane(startupDirectory);
      *newPaneId = newPane->getPane().id;
      vector<LayoutNodePtr> newChildren(children);
      newChildren.insert(newChildren.begin() + a + 1, newPane);
      return LayoutNode::makeSplit(node->getDirection(), newChildren);
    }
  }

  for (size_t a = 0; a < children.size(); a++) {
    LayoutNodePtr newChild =
        splitNode(children[a], targetId, direction, startupDirectory,
                  maxSameDirectionPanes, newPaneId);
    if (newChild != children[a]) {
      vector<LayoutNodePtr> newChildren(children);
      newChildren[a] = newChild;
      return LayoutNode::makeSplit(node->getDirection(), newChildren);
    }
  }
  return node;
}

LayoutNodePtr LayoutTree::close(const LayoutNodePtr& root, PaneId paneId) {
  if (!root) {
    return root;
  }
  bool changed = false;
  LayoutNodePtr newRoot = removeNode(root, paneId, &changed);
  if (!changed) {
    VLOG(1) << "Close of unknown pane " << paneIdToString(paneId);
    return root;
  }
  return newRoot;
}

LayoutNodePtr LayoutTree::removeNode(const LayoutNodePtr& node, PaneId paneId,
                                     bool* changed) {
  if (node->isPane()) {
    if (node->getPane().id == paneId) {
      *changed = true;
      return LayoutNodePtr();
    }
    return node;
  }

  const vector<LayoutNodePtr>& children = node->getChildren();
  vector<LayoutNodePtr> remaining;
  remaining.reserve(children.size());
  for (const auto& child : children) {
    if (*changed) {
      remaining.push_back(child);
      continue;
    }
    LayoutNodePtr newChild = removeNode(child, paneId, changed);
    if (newChild) {
      remaining.push_back(newChild);
    }
  }
  if (!*changed) {
    return node;
  }

  if (remaining.empty()) {
    return LayoutNodePtr();
  }
  if (remaining.size() == 1) {
    // The split collapses into its last child; the parent re-checks nesting
    return remaining[0];
  }

  // A collapsed grandchild may now be a split of our own direction: splice
  // its children in so splits never nest in the same direction.
  vector<LayoutNodePtr> flattened;
  for (const auto& child : remaining) {
    if (!child->isPane() && child->getDirection() == node->getDirection()) {
      flattened.insert(flattened.end(), child->getChildren().begin(),
                       child->getChildren().end());
    } else {
      flattened.push_back(child);
    }
  }
  return LayoutNode::makeSplit(node->getDirection(), flattened);
}

void LayoutTree::collectPanes(const LayoutNodePtr& node, vector<Pane>* panes) {
  if (node->isPane()) {
    panes->push_back(node->getPane());
    return;
  }
  for (const auto& child : node->getChildren()) {
    collectPanes(child, panes);
  }
}

vector<Pane> LayoutTree::findAllPanes(const LayoutNodePtr& root) {
  vector<Pane> panes;
  if (root) {
    collectPanes(root, &panes);
  }
  return panes;
}

optional<Pane> LayoutTree::findPane(const LayoutNodePtr& root, PaneId paneId) {
  if (!root) {
    return nullopt;
  }
  if (root->isPane()) {
    if (root->getPane().id == paneId) {
      return root->getPane();
    }
    return nullopt;
  }
  for (const auto& child : root->getChildren()) {
    auto found = findPane(child, paneId);
    if (found) {
      return found;
    }
  }
  return nullopt;
}

bool LayoutTree::containsPane(const LayoutNodePtr& root, PaneId paneId) {
  return findPane(root, paneId).has_value();
}

int LayoutTree::countPanes(const LayoutNodePtr& root) {
  if (!root) {
    return 0;
  }
  if (root->isPane()) {
    return 1;
  }
  int count = 0;
  for (const auto& child : root->getChildren()) {
    count += countPanes(child);
  }
  return count;
}

LayoutNodePtr LayoutTree::updatePane(
    const LayoutNodePtr& root, PaneId paneId,
    const std::function<Pane(const Pane&)>& fn) {
  if (!root) {
    return root;
  }
  if (root->isPane()) {
    if (root->getPane().id != paneId) {
      return root;
    }
    Pane updated = fn(root->getPane());
    // Identity is immutable; only the metadata may change
    updated.id = paneId;
    return LayoutNode::makePane(updated);
  }
  const vector<LayoutNodePtr>& children = root->getChildren();
  for (size_t a = 0; a < children.size(); a++) {
    LayoutNodePtr newChild = updatePane(children[a], paneId, fn);
    if (newChild != children[a]) {
      vector<LayoutNodePtr> newChildren(children);
      newChildren[a] = newChild;
      return LayoutNode::makeSplit(root->getDirection(), newChildren);
    }
  }
  return root;
}

PaneId LayoutTree::nextPane(const LayoutNodePtr& root, PaneId current) {
  vector<Pane> panes = findAllPanes(root);
  if (panes.empty()) {
    return current;
  }
  for (size_t a = 0; a < panes.size(); a++) {
    if (panes[a].id == current) {
      return panes[(a + 1) % panes.size()].id;
    }
  }
  return panes.front().id;
}

PaneId LayoutTree::prevPane(const LayoutNodePtr& root, PaneId current) {
  vector<Pane> panes = findAllPanes(root);
  if (panes.empty()) {
    return current;
  }
  for (size_t a = 0; a < panes.size(); a++) {
    if (panes[a].id == current) {
      return panes[(a + panes.size() - 1) % panes.size()].id;
    }
  }
  return panes.front().id;
}

bool LayoutTree::isValid(const LayoutNodePtr& root) {
  if (!root) {
    return false;
  }
  if (root->isPane()) {
    return true;
  }
  if (root->getChildren().size() < 2) {
    return false;
  }
  for (const auto& child : root->getChildren()) {
    if (!child) {
      return false;
    }
    if (!child->isPane() && child->getDirection() == root->getDirection()) {
      return false;
    }
    if (!isValid(child)) {
      return false;
    }
  }
  return true;
}

bool LayoutTree::structurallyEqual(const LayoutNodePtr& a,
                                   const LayoutNodePtr& b) {
  if (a == b) {
    return true;
  }
  if (!a || !b || a->isPane() != b->isPane()) {
    return false;
  }
  if (a->isPane()) {
    const Pane& pa = a->getPane();
    const Pane& pb = b->getPane();
    return pa.id == pb.id && pa.backendHandle == pb.backendHandle &&
           pa.startupDirectory == pb.startupDirectory;
  }
  if (a->getDirection() != b->getDirection() ||
      a->getChildren().size() != b->getChildren().size()) {
    return false;
  }
  for (size_t i = 0; i < a->getChildren().size(); i++) {
    if (!structurallyEqual(a->getChildren()[i], b->getChildren()[i])) {
      return false;
    }
  }
  return true;
}

json LayoutTree::toJson(const LayoutNodePtr& root) {
  json node;
  if (!root) {
    return node;
  }
  if (root->isPane()) {
    const Pane& pane = root->getPane();
    node["type"] = "pane";
    node["id"] = paneIdToString(pane.id);
    if (pane.backendHandle) {
      node["backendHandle"] = *pane.backendHandle;
    } else {
      node["backendHandle"] = nullptr;
    }
    if (pane.startupDirectory) {
      node["startupDirectory"] = *pane.startupDirectory;
    }
    return node;
  }
  node["type"] = "split";
  node["direction"] = directionToString(root->getDirection());
  node["children"] = json::array();
  for (const auto& child : root->getChildren()) {
    node["children"].push_back(toJson(child));
  }
  return node;
}
}  // namespace pmx
