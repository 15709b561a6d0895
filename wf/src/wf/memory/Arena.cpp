#include "wf/memory/Arena.h"
#include "wf/Assert.h"

namespace wf::memory
{
	inline static uint8_t*
	_align_up(uint8_t* ptr, uint8_t alignment)
	{
		if (alignment <= 1)
			return ptr;
		auto value = uintptr_t(ptr);
		auto mask = uintptr_t(alignment) - 1;
		return (uint8_t*)((value + mask) & ~mask);
	}

	Arena::Arena(size_t block_size, Interface* meta)
	{
		wf_assert(block_size != 0);
		this->meta = meta;
		this->head = nullptr;
		this->block_size = block_size;
		this->total_mem = 0;
		this->used_mem = 0;
		this->highwater_mem = 0;
	}

	Arena::~Arena()
	{
		free_all();
	}

	Block
	Arena::alloc(size_t size, uint8_t alignment)
	{
		grow(size, alignment);

		uint8_t* ptr = _align_up(this->head->alloc_head, alignment);
		this->used_mem += (ptr - this->head->alloc_head) + size;
		this->head->alloc_head = ptr + size;
		if (this->used_mem > this->highwater_mem)
			this->highwater_mem = this->used_mem;

		return Block{ ptr, size };
	}

	void
	Arena::free(Block)
	{
	}

	void
	Arena::grow(size_t size, uint8_t alignment)
	{
		if (this->head != nullptr)
		{
			uint8_t* node_end = (uint8_t*)this->head->mem.ptr + this->head->mem.size;
			uint8_t* ptr = _align_up(this->head->alloc_head, alignment);
			if (ptr <= node_end && size_t(node_end - ptr) >= size)
				return;
		}

		// worst case padding to reach the alignment is alignment - 1 bytes
		size_t needed = size + (alignment > 1 ? alignment - 1 : 0);
		size_t request_size = needed > this->block_size ? needed : this->block_size;
		request_size += sizeof(Node);

		Node* new_node = (Node*)meta->alloc(request_size, alignof(Node)).ptr;
		this->total_mem += request_size - sizeof(Node);

		new_node->mem.ptr = &new_node[1];
		new_node->mem.size = request_size - sizeof(Node);
		new_node->alloc_head = (uint8_t*)new_node->mem.ptr;
		new_node->next = this->head;
		this->head = new_node;
	}

	void
	Arena::free_all()
	{
		while (this->head)
		{
			Node* next = this->head->next;
			meta->free(Block{ this->head, this->head->mem.size + sizeof(Node) });
			this->head = next;
		}
		this->total_mem = 0;
		this->used_mem = 0;
	}

	void
	Arena::clear_all()
	{
		if (this->head == nullptr)
			return;

		if (this->head->next != nullptr)
		{
			// many nodes means the last unit of work outgrew a single node, so replace them with one big node
			size_t highwater = this->highwater_mem;
			this->free_all();
			this->grow(highwater, 1);
		}
		else
		{
			this->head->alloc_head = (uint8_t*)this->head->mem.ptr;
			this->used_mem = 0;
		}
	}
}
