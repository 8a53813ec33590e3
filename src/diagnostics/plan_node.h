#pragma once

#include <memory>
#include <string>
#include <typeinfo>
#include <vector>

namespace Estuary {

enum class PlanNodeType {
	INGRESS,
	UNION,
};

const char* PlanNodeTypeName(PlanNodeType type);

/**
 * Demangled name of a type, for plan reporting
 */
std::string DemangledTypeName(const std::type_info& info);

template <typename T>
std::string TypeName() {
	return DemangledTypeName(typeid(T));
}

/**
 * Node of a query-plan tree as reported by operators for introspection.
 * A node has no effect on execution.
 */
class PlanNode {
public:
	using Ptr = std::shared_ptr<PlanNode>;

	/**
	 * @param type Kind of operator
	 * @param pipe_id Identity of the operator instance that produced the node
	 * @param key_type Key type name
	 * @param payload_type Payload type name
	 * @param error_messages Error-context string recorded at operator construction
	 */
	PlanNode(PlanNodeType type, const void* pipe_id, std::string key_type,
	         std::string payload_type, std::string error_messages);
	virtual ~PlanNode() = default;

	PlanNodeType type() const { return type_; }
	const void* pipe_id() const { return pipe_id_; }
	const std::string& key_type() const { return key_type_; }
	const std::string& payload_type() const { return payload_type_; }
	const std::string& error_messages() const { return error_messages_; }

	virtual std::vector<Ptr> Children() const { return {}; }

	// Multi-line rendering of this node and its subtree
	std::string ToString() const;

protected:
	// Annotations appended after the node name on its line
	virtual std::string Annotations() const;

private:
	void Render(std::string& out, int level) const;

	PlanNodeType type_;
	const void* pipe_id_;
	std::string key_type_;
	std::string payload_type_;
	std::string error_messages_;
};

/**
 * Leaf node for a stream entering the plan
 */
class IngressPlanNode : public PlanNode {
public:
	IngressPlanNode(const void* pipe_id, std::string key_type, std::string payload_type, std::string name);

	const std::string& name() const { return name_; }

protected:
	std::string Annotations() const override;

private:
	std::string name_;
};

class BinaryPlanNode : public PlanNode {
public:
	BinaryPlanNode(PlanNodeType type, Ptr left, Ptr right, const void* pipe_id,
	               std::string key_type, std::string payload_type, std::string error_messages);

	const Ptr& left() const { return left_; }
	const Ptr& right() const { return right_; }

	std::vector<Ptr> Children() const override;

private:
	Ptr left_;
	Ptr right_;
};

class UnionPlanNode : public BinaryPlanNode {
public:
	UnionPlanNode(Ptr left, Ptr right, const void* pipe_id, std::string key_type,
	              std::string payload_type, bool is_generated, bool partitioned,
	              std::string error_messages);

	bool is_generated() const { return is_generated_; }
	bool partitioned() const { return partitioned_; }

protected:
	std::string Annotations() const override;

private:
	bool is_generated_;
	bool partitioned_;
};

} // namespace Estuary
